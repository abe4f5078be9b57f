#pragma once

#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>

namespace details::string {

/**
 * @brief Parses the whole of the given string into the given output value.
 *
 * Leading or trailing garbage fails the parse. Unsigned targets additionally
 * reject a leading minus sign, which std::istream would otherwise wrap around.
 *
 * @tparam T the type of the output value
 * @param str the string to parse
 * @param outval the output value, untouched on failure
 * @return true if the parsing was successful, false otherwise
 */
template <typename T>
    requires std::is_arithmetic_v<T>
bool try_parse(const std::string_view str, T* outval) {
    if (str.empty()) {
        return false;
    }
    if constexpr (std::is_unsigned_v<T>) {
        if (str.front() == '-') {
            return false;
        }
    }
    std::istringstream ss{std::string(str)};
    T temp{};

    if (static_cast<bool>(ss >> std::noskipws >> temp)) {
        // Anything left means the previous parsing didn't consume the full
        // string
        if (ss.peek() != std::char_traits<char>::eof()) {
            return false;
        }
        *outval = temp;
        return true;
    }
    return false;
}

}  // namespace details::string

template <typename T>
bool try_parse(const std::string_view str, T* outval) {
    return details::string::try_parse<T>(str, outval);
}
