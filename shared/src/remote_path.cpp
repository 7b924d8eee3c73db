#include "sftpgate/remote_path.hpp"

namespace sftpgate::remote_path
{

    namespace
    {
        constexpr auto kHomeLabel = "Home";

        std::vector<std::string_view> split_segments(std::string_view path)
        {
            std::vector<std::string_view> parts;
            std::size_t start = 0;
            while (start <= path.size())
            {
                const auto slash = path.find('/', start);
                const auto end = slash == std::string_view::npos ? path.size() : slash;
                if (end > start)
                {
                    parts.push_back(path.substr(start, end - start));
                }
                if (slash == std::string_view::npos)
                {
                    break;
                }
                start = slash + 1;
            }
            return parts;
        }
    } // namespace

    std::string clean(std::string_view path)
    {
        if (path.empty())
        {
            return ".";
        }
        const bool rooted = path.front() == '/';
        std::vector<std::string_view> stack;
        for (const auto part : split_segments(path))
        {
            if (part == ".")
            {
                continue;
            }
            if (part == "..")
            {
                if (!stack.empty() && stack.back() != "..")
                {
                    stack.pop_back();
                }
                else if (!rooted)
                {
                    stack.push_back(part);
                }
                continue;
            }
            stack.push_back(part);
        }

        std::string result = rooted ? "/" : "";
        for (std::size_t i = 0; i < stack.size(); ++i)
        {
            if (i > 0)
            {
                result.push_back('/');
            }
            result.append(stack[i]);
        }
        if (result.empty())
        {
            return ".";
        }
        return result;
    }

    std::string join(std::string_view base, std::string_view name)
    {
        if (base.empty())
        {
            return clean(name);
        }
        std::string combined(base);
        combined.push_back('/');
        combined.append(name);
        return clean(combined);
    }

    std::string base_name(std::string_view path)
    {
        if (path.empty())
        {
            return ".";
        }
        while (path.size() > 1 && path.back() == '/')
        {
            path.remove_suffix(1);
        }
        if (path == "/")
        {
            return "/";
        }
        const auto slash = path.rfind('/');
        if (slash != std::string_view::npos)
        {
            path.remove_prefix(slash + 1);
        }
        return std::string(path);
    }

    std::string extension(std::string_view path)
    {
        const auto name = base_name(path);
        const auto dot = name.rfind('.');
        if (dot == std::string::npos)
        {
            return {};
        }
        return name.substr(dot);
    }

    bool is_hidden_name(std::string_view name) noexcept
    {
        return !name.empty() && name.front() == '.';
    }

    std::vector<protocol::Breadcrumb> breadcrumbs(std::string_view path)
    {
        std::vector<protocol::Breadcrumb> crumbs{{.name = kHomeLabel, .path = "/"}};
        std::string current;
        for (const auto part : split_segments(path))
        {
            current.push_back('/');
            current.append(part);
            crumbs.push_back({.name = std::string(part), .path = current});
        }
        return crumbs;
    }

} // namespace sftpgate::remote_path
