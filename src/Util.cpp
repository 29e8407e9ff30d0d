#include "Util.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <iterator>
#include <print>
#include <random>
#include <system_error>

namespace Util
{

auto trim(std::string_view str) -> std::string_view
{
    constexpr static std::string_view WHITESPACE = " \t\r\n\v\f";

    const auto first = str.find_first_not_of(WHITESPACE);
    if (first == std::string_view::npos) { return {}; }

    const auto last = str.find_last_not_of(WHITESPACE);
    return str.substr(first, last - first + 1);
}

auto iequals(std::string_view lhs, std::string_view rhs) -> bool
{
    return std::ranges::equal(lhs, rhs, [](const unsigned char a, const unsigned char b) {
        return std::tolower(a) == std::tolower(b);
    });
}

auto snake_case_to_title(std::string_view str) -> std::string
{
    std::string title;
    title.reserve(str.size());

    bool upper_next = true;
    for (const unsigned char c : str) {
        if (c == '_' || c == ' ') {
            title.push_back(' ');
            upper_next = true;
            continue;
        }

        title.push_back(static_cast<char>(upper_next ? std::toupper(c) : c));
        upper_next = false;
    }

    return title;
}

auto parse_natural(std::string_view str) -> std::optional<std::size_t>
{
    std::size_t value = 0;

    const auto* last         = str.data() + str.size();
    const auto [stop, error] = std::from_chars(str.data(), last, value);
    if (error == std::errc::result_out_of_range) {
        std::println(stderr, "[ERROR] (util) `{}` does not fit in a natural number", str);
        return std::nullopt;
    }
    if (error != std::errc {} || stop != last) {
        std::println(stderr, "[ERROR] (util) `{}` is not a natural number", str);
        return std::nullopt;
    }

    return value;
}

auto parse_real(std::string_view str) -> std::optional<double>
{
    double value = 0.0;

    const auto* last         = str.data() + str.size();
    const auto [stop, error] = std::from_chars(str.data(), last, value);
    if (error != std::errc {} || stop != last) { return std::nullopt; }

    return value;
}

auto read_entire_file(const std::filesystem::path& file_path) -> std::optional<std::string>
{
    std::error_code error;
    if (!std::filesystem::is_regular_file(file_path, error)) {
        const auto reason = error ? error.message() : std::string("not a regular file");
        std::println(stderr, "[ERROR] (io) cannot read {}: {}", file_path.string(), reason);
        return std::nullopt;
    }

    std::ifstream file(file_path, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        std::println(stderr, "[ERROR] (io) cannot open {}", file_path.string());
        return std::nullopt;
    }

    return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char> {});
}

auto write_to_file(const std::filesystem::path& file_path, const std::string& content) -> bool
{
    std::ofstream file(file_path, std::ios::out | std::ios::trunc);
    if (!file.is_open()) {
        std::println(stderr, "[ERROR] (io) cannot open {} for writing", file_path.string());
        return false;
    }

    file << content;
    if (!file.flush()) {
        std::println(stderr, "[ERROR] (io) failed writing {}", file_path.string());
        return false;
    }

    return true;
}

auto random_natural(const std::size_t min, const std::size_t max) -> std::size_t
{
    if (max <= min) { return min; }

    static std::mt19937_64 engine { std::random_device {}() };
    return std::uniform_int_distribution<std::size_t> { min, max }(engine);
}

} // namespace Util
