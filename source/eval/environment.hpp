#pragma once

#include <ostream>
#include <string>
#include <unordered_map>

#include <lexer/location.hpp>
#include <object/object.hpp>

// One block scope. `outer` is a non-owning link to the lexically enclosing scope.
struct environment final
{
    explicit environment(environment* outer_env = nullptr);
    ~environment() = default;
    environment(const environment&) = delete;
    environment(environment&&) = delete;
    auto operator=(const environment&) -> environment& = delete;
    auto operator=(environment&&) -> environment& = delete;

    auto define(const std::string& name, object val) -> void;
    [[nodiscard]] auto get(const std::string& name, const location& loc) const -> const object&;
    auto assign(const std::string& name, object val, const location& loc) -> const object&;

    void debug(std::ostream& out) const;

    std::unordered_map<std::string, object> store;
    environment* outer {};
};
