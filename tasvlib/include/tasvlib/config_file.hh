#pragma once

#include <charconv>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <tasvlib/concat_tostr.hh>
#include <tasvlib/macros/throw.hh>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

// Parses files of form:
//   # comment
//   name: value
//   quoted: 'single quoted, '' is an escaped apostrophe'
//   escaped: "double quoted\twith \x41 escapes"
//   list: [a, 'b c', "d"]
class ConfigFile {
public:
    class ParseError : public std::runtime_error {
    public:
        template <class... Args, std::enable_if_t<(is_string_argument<Args> and ...), int> = 0>
        explicit ParseError(size_t line, size_t pos, Args&&... msg)
        : runtime_error(concat_tostr("line ", line, ':', pos, ": ", std::forward<Args>(msg)...)
          ) {}
    };

    class Variable {
        // monostate until the variable appears in the loaded config
        std::variant<std::monostate, std::string, std::vector<std::string>> value_;

        friend class ConfigFile;

    public:
        [[nodiscard]] bool is_set() const noexcept {
            return !std::holds_alternative<std::monostate>(value_);
        }

        [[nodiscard]] bool is_array() const noexcept {
            return std::holds_alternative<std::vector<std::string>>(value_);
        }

        // Empty if the variable is unset or is an array
        [[nodiscard]] const std::string& as_string() const noexcept {
            static const std::string empty;
            const auto* str = std::get_if<std::string>(&value_);
            return str ? *str : empty;
        }

        // Empty if the variable is unset or is not an array
        [[nodiscard]] const std::vector<std::string>& as_array() const noexcept {
            static const std::vector<std::string> empty;
            const auto* arr = std::get_if<std::vector<std::string>>(&value_);
            return arr ? *arr : empty;
        }

        // std::nullopt unless the whole value is a number of type T
        template <class T, std::enable_if_t<std::is_arithmetic_v<T>, int> = 0>
        [[nodiscard]] std::optional<T> as() const noexcept {
            const auto& str = as_string();
            T res{};
            const char* end = str.data() + str.size();
            auto [ptr, ec] = std::from_chars(str.data(), end, res);
            if (str.empty() or ec != std::errc{} or ptr != end) {
                return std::nullopt;
            }
            return res;
        }
    };

private:
    std::map<std::string, Variable, std::less<>> vars_;

public:
    // Declares variables to load, redeclaring is a no-op
    template <class... Args>
    void add_vars(Args&&... names) {
        (vars_.try_emplace(std::forward<Args>(names)), ...);
    }

    // Unknown names yield an unset variable
    const Variable& operator[](std::string_view name) const noexcept {
        static const Variable unset;
        auto it = vars_.find(name);
        return it != vars_.end() ? it->second : unset;
    }

    // Throws if @p name is unset, empty or an array
    [[nodiscard]] const std::string& required_string(std::string_view name) const {
        const auto& var = (*this)[name];
        if (!var.is_set() or var.is_array() or var.as_string().empty()) {
            THROW("Missing required config variable: ", name);
        }
        return var.as_string();
    }

    // @p default_value if @p name is unset, throws if it is set to something else than a number
    template <class T>
    [[nodiscard]] T number_or(std::string_view name, T default_value) const {
        const auto& var = (*this)[name];
        if (!var.is_set()) {
            return default_value;
        }
        auto val = var.as<T>();
        if (!val) {
            THROW("Config variable ", name, " has to be a number, got: ", var.as_string());
        }
        return *val;
    }

    /**
     * @brief Loads declared variables from file @p pathname
     *
     * @param load_all also load variables that were not declared with add_vars()
     *
     * @errors Throws std::runtime_error if the file cannot be read and ParseError
     *   if its contents are malformed
     */
    void load_config_from_file(const std::string& pathname, bool load_all = false);

    // Like load_config_from_file() but reads from @p config
    void load_config_from_string(std::string_view config, bool load_all = false);
};
