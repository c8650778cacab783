/**
 * Base64.cpp - Base64 via Boost.Serialization dataflow iterators
 */

#include "emv/protocol/Base64.hpp"

#include <algorithm>
#include <cctype>

#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/binary_from_base64.hpp>
#include <boost/archive/iterators/dataflow_exception.hpp>
#include <boost/archive/iterators/transform_width.hpp>

namespace emv::protocol {

namespace bai = boost::archive::iterators;

std::string base64Encode(const std::string& bytes) {
    using Encoder = bai::base64_from_binary<bai::transform_width<std::string::const_iterator, 6, 8>>;

    std::string out(Encoder(bytes.begin()), Encoder(bytes.end()));
    out.append((3 - bytes.size() % 3) % 3, '=');
    return out;
}

std::optional<std::string> base64Decode(const std::string& text) {
    using Decoder = bai::transform_width<bai::binary_from_base64<std::string::const_iterator>, 8, 6>;

    std::string s;
    s.reserve(text.size());
    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) s.push_back(c);
    }
    if (s.empty()) return std::string();
    if (s.size() % 4 != 0) return std::nullopt;

    size_t padding = 0;
    while (padding < 2 && s[s.size() - 1 - padding] == '=') padding++;
    if (std::find(s.begin(), s.end() - static_cast<std::ptrdiff_t>(padding), '=') !=
        s.end() - static_cast<std::ptrdiff_t>(padding)) {
        return std::nullopt;
    }
    // binary_from_base64 has no notion of padding
    std::fill(s.end() - static_cast<std::ptrdiff_t>(padding), s.end(), 'A');

    try {
        std::string out(Decoder(s.begin()), Decoder(s.end()));
        out.resize(out.size() - padding);
        return out;
    } catch (const bai::dataflow_exception&) {
        return std::nullopt;
    }
}

} // namespace emv::protocol
