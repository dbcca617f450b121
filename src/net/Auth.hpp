//
// Auth.hpp
//

#ifndef GRIDDUEL_AUTH_HPP
#define GRIDDUEL_AUTH_HPP

#include <optional>
#include <string>
#include <string_view>

#include "../core/Types.hpp"

namespace gridduel::net
{
    // Maps a bearer token to a user id. nullopt rejects the request.
    class Authenticator
    {
    public:
        virtual ~Authenticator() = default;
        virtual auto Authenticate(std::string_view token) const -> std::optional<core::PlayerId> = 0;
    };

    // Development stand-in: the token is the user id.
    class TrustingAuthenticator final : public Authenticator
    {
    public:
        auto Authenticate(std::string_view token) const -> std::optional<core::PlayerId> override
        {
            if (token.empty()) return std::nullopt;
            return core::PlayerId{token};
        }
    };

    // "token" query parameter of a request target such as "/ws?token=abc&x=1".
    inline auto TokenFromQuery(std::string_view resource) -> std::optional<std::string>
    {
        auto const q = resource.find('?');
        if (q == std::string_view::npos) return std::nullopt;

        std::string_view query = resource.substr(q + 1);
        while (!query.empty())
        {
            auto const amp = query.find('&');
            std::string_view const pair = query.substr(0, amp);
            if (pair.starts_with("token=")) return std::string{pair.substr(6)};
            if (amp == std::string_view::npos) break;
            query.remove_prefix(amp + 1);
        }
        return std::nullopt;
    }

    // "Bearer <token>" (scheme is case-insensitive).
    inline auto TokenFromBearer(std::string_view header) -> std::optional<std::string>
    {
        constexpr std::string_view scheme = "bearer ";
        if (header.size() <= scheme.size()) return std::nullopt;
        for (std::size_t i{}; i < scheme.size(); ++i)
        {
            char const c = header[i];
            char const lower = (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
            if (lower != scheme[i]) return std::nullopt;
        }
        std::string_view token = header.substr(scheme.size());
        while (!token.empty() && token.front() == ' ') token.remove_prefix(1);
        if (token.empty()) return std::nullopt;
        return std::string{token};
    }
}

#endif //GRIDDUEL_AUTH_HPP
