#pragma once

#include <string>
#include <string_view>

namespace sftpgate::file_types
{

    // Syntax-highlighting language for an extension such as ".py"; "text" when unknown.
    std::string language_for_extension(std::string_view extension);

    bool is_image_extension(std::string_view extension);
    bool is_document_extension(std::string_view extension);
    bool is_archive_extension(std::string_view extension);
    bool is_code_extension(std::string_view extension);

    std::string to_lower(std::string_view text);

} // namespace sftpgate::file_types
