/**
 * sftpgate - Lexical helpers for remote (always '/'-separated) paths.
 *
 * Remote paths never go through std::filesystem: the gateway host may not share the remote
 * server's separator or root conventions.
 */
#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "sftpgate/protocol.hpp"

namespace sftpgate::remote_path
{

    // Shortest equivalent path: collapses "//", ".", and resolves ".." lexically. "" becomes ".".
    std::string clean(std::string_view path);

    std::string join(std::string_view base, std::string_view name);

    // Last element after trailing slashes are removed; "/" for the root and "." for "".
    std::string base_name(std::string_view path);

    // Extension of the last element including the dot, or "" when there is none.
    std::string extension(std::string_view path);

    bool is_hidden_name(std::string_view name) noexcept;

    std::vector<protocol::Breadcrumb> breadcrumbs(std::string_view path);

} // namespace sftpgate::remote_path
