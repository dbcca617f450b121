//
// OmegaException.hpp
//

#ifndef GRIDDUEL_OMEGAEXCEPTION_HPP
#define GRIDDUEL_OMEGAEXCEPTION_HPP

#include <cstddef>
#include <format>
#include <source_location>
#include <stacktrace>
#include <string>
#include <string_view>
#include <utility>

namespace gridduel::core
{
    // Carries a typed payload plus where it was raised.
    // Not derived from std::exception; catch it by its own type.
    template <typename T>
    class OmegaException
    {
    public:
        OmegaException(std::string err_str,
                       T usr_data,
                       std::source_location const& src_loc = std::source_location::current(),
                       std::stacktrace backtrace = std::stacktrace::current()) :
            err_str_{std::move(err_str)},
            usr_data_{std::move(usr_data)},
            src_loc_{src_loc},
            backtrace_{std::move(backtrace)}
        {
        }

        [[nodiscard]]
        auto what() const noexcept -> std::string const& { return err_str_; }

        [[nodiscard]]
        auto where() const noexcept -> std::source_location const& { return src_loc_; }

        [[nodiscard]]
        auto stack() const noexcept -> std::stacktrace const& { return backtrace_; }

        auto data() const noexcept -> T const& { return usr_data_; }

        [[nodiscard]]
        auto to_str() const -> std::string
        {
            std::string s = std::format("{}({}:{}), function `{}`\n", src_loc_.file_name(), src_loc_.line(),
                                        src_loc_.column(), src_loc_.function_name());
            // skip the frames belonging to the throw helpers
            std::size_t const frames = backtrace_.size() > 3 ? backtrace_.size() - 3 : backtrace_.size();
            for (std::size_t i{}; i < frames; ++i)
            {
                auto const& entry = backtrace_[i];
                s += std::format("{}({}):{}\n", entry.source_file(), entry.source_line(), entry.description());
            }
            return s;
        }

    private:
        std::string err_str_;
        T usr_data_;
        std::source_location src_loc_;
        std::stacktrace backtrace_;
    };
}

template <class T>
struct std::formatter<gridduel::core::OmegaException<T>> : std::formatter<std::string_view>
{
    template <class FormatContext>
    auto format(gridduel::core::OmegaException<T> const& p, FormatContext& ctx) const
    {
        std::string s = std::format("Failed with code ({}): {}\n{}", static_cast<int>(p.data()), p.what(),
                                    p.to_str());
        return std::formatter<std::string_view>::format(s, ctx);
    }
};

#endif //GRIDDUEL_OMEGAEXCEPTION_HPP
