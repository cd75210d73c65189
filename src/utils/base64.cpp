#include "call_engine/utils/base64.hpp"

#include <algorithm>

#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/binary_from_base64.hpp>
#include <boost/archive/iterators/dataflow_exception.hpp>
#include <boost/archive/iterators/transform_width.hpp>

namespace call_engine::utils {

namespace {

namespace it = boost::archive::iterators;

using EncodeIterator = it::base64_from_binary<it::transform_width<std::string::const_iterator, 6, 8>>;
using DecodeIterator = it::transform_width<it::binary_from_base64<std::string::const_iterator>, 8, 6>;

}

std::string base64_encode(const std::string& data) {
    std::string encoded(EncodeIterator(data.begin()), EncodeIterator(data.end()));
    encoded.append((3 - data.size() % 3) % 3, '=');
    return encoded;
}

std::string base64_decode(const std::string& encoded) {
    std::string trimmed = encoded;
    trimmed.erase(std::remove_if(trimmed.begin(), trimmed.end(),
                                 [](char ch) { return ch == '\n' || ch == '\r' || ch == ' '; }),
                  trimmed.end());
    if (trimmed.empty() || trimmed.size() % 4 != 0) {
        return {};
    }
    const auto padding = static_cast<size_t>(std::count(trimmed.end() - 2, trimmed.end(), '='));
    std::replace(trimmed.end() - static_cast<std::ptrdiff_t>(padding), trimmed.end(), '=', 'A');
    try {
        std::string decoded(DecodeIterator(trimmed.begin()), DecodeIterator(trimmed.end()));
        decoded.erase(decoded.size() - std::min(padding, decoded.size()));
        return decoded;
    } catch (const it::dataflow_exception&) {
        return {};
    }
}

}
