#include "ibauth/auth/canonical_request.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace ibauth::auth
{
    namespace
    {
        constexpr std::array<std::pair<const char*, const char*>, 3> kCorrections = {{
            {"%257C", "%7C"}, // |
            {"%252C", "%2C"}, // ,
            {"%253A", "%3A"}  // :
        }};

        bool is_unreserved(const unsigned char c)
        {
            return std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~';
        }

        void replace_all(std::string& str, const std::string& from, const std::string& to)
        {
            size_t pos = 0;
            while ((pos = str.find(from, pos)) != std::string::npos)
            {
                str.replace(pos, from.size(), to);
                pos += to.size();
            }
        }
    }

    std::string CanonicalRequestBuilder::percent_encode(const std::string& value)
    {
        static constexpr char kHex[] = "0123456789ABCDEF";

        std::string result;
        result.reserve(value.size() * 3);
        for (const char ch : value)
        {
            const auto c = static_cast<unsigned char>(ch);
            if (is_unreserved(c))
            {
                result.push_back(ch);
            }
            else
            {
                result.push_back('%');
                result.push_back(kHex[c >> 4]);
                result.push_back(kHex[c & 0x0F]);
            }
        }
        return result;
    }

    std::string CanonicalRequestBuilder::parameter_string(const ParamMap& params)
    {
        std::string result;
        for (const auto& [key, value] : params)
        {
            if (!result.empty())
                result.push_back('&');
            result += key;
            result.push_back('=');
            result += percent_encode(value);
        }
        return result;
    }

    std::string CanonicalRequestBuilder::build(
        const std::string& method,
        const std::string& url,
        const ParamMap& params,
        const std::string& prepend)
    {
        std::string upper_method = method;
        std::transform(upper_method.begin(), upper_method.end(), upper_method.begin(),
                       [](const unsigned char c) { return static_cast<char>(std::toupper(c)); });

        auto base_string = upper_method + "&" + percent_encode(url) + "&" + percent_encode(parameter_string(params));

        if (!prepend.empty())
            base_string = prepend + base_string;

        return apply_corrections(std::move(base_string));
    }

    std::string CanonicalRequestBuilder::apply_corrections(std::string base_string)
    {
        for (const auto& [from, to] : kCorrections)
            replace_all(base_string, from, to);
        return base_string;
    }
} // namespace ibauth::auth
