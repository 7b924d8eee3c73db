#include "sftpgate/file_types.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace sftpgate::file_types
{

    namespace
    {
        struct LanguageMapping
        {
            std::string_view extension;
            std::string_view language;
        };

        constexpr std::array<LanguageMapping, 73> kLanguages{{
            {".js", "javascript"},
            {".jsx", "jsx"},
            {".ts", "typescript"},
            {".tsx", "tsx"},
            {".py", "python"},
            {".go", "go"},
            {".java", "java"},
            {".c", "c"},
            {".cpp", "cpp"},
            {".cc", "cpp"},
            {".cxx", "cpp"},
            {".h", "c"},
            {".hpp", "cpp"},
            {".cs", "csharp"},
            {".php", "php"},
            {".rb", "ruby"},
            {".rs", "rust"},
            {".swift", "swift"},
            {".kt", "kotlin"},
            {".scala", "scala"},
            {".sh", "bash"},
            {".bash", "bash"},
            {".zsh", "bash"},
            {".fish", "bash"},
            {".ps1", "powershell"},
            {".sql", "sql"},
            {".html", "html"},
            {".htm", "html"},
            {".xml", "xml"},
            {".css", "css"},
            {".scss", "scss"},
            {".sass", "sass"},
            {".less", "less"},
            {".json", "json"},
            {".yaml", "yaml"},
            {".yml", "yaml"},
            {".toml", "toml"},
            {".ini", "ini"},
            {".conf", "ini"},
            {".cfg", "ini"},
            {".md", "markdown"},
            {".markdown", "markdown"},
            {".tex", "latex"},
            {".r", "r"},
            {".m", "matlab"},
            {".pl", "perl"},
            {".lua", "lua"},
            {".vim", "vim"},
            {".dockerfile", "dockerfile"},
            {".docker", "dockerfile"},
            {".makefile", "makefile"},
            {".mk", "makefile"},
            {".cmake", "cmake"},
            {".gradle", "gradle"},
            {".groovy", "groovy"},
            {".clj", "clojure"},
            {".elm", "elm"},
            {".ex", "elixir"},
            {".exs", "elixir"},
            {".erl", "erlang"},
            {".hrl", "erlang"},
            {".fs", "fsharp"},
            {".fsx", "fsharp"},
            {".ml", "ocaml"},
            {".mli", "ocaml"},
            {".hs", "haskell"},
            {".lhs", "haskell"},
            {".dart", "dart"},
            {".v", "verilog"},
            {".sv", "systemverilog"},
            {".vhd", "vhdl"},
            {".vhdl", "vhdl"},
            {".log", "text"},
        }};

        constexpr std::array<std::string_view, 10> kImageExtensions{
            ".jpg", ".jpeg", ".png", ".gif", ".bmp", ".svg", ".webp", ".ico", ".tiff", ".tif"};

        constexpr std::array<std::string_view, 12> kDocumentExtensions{
            ".pdf", ".doc", ".docx", ".xls", ".xlsx", ".ppt", ".pptx", ".txt", ".rtf", ".odt", ".ods", ".odp"};

        // Compound suffixes never match: extensions are taken after the last dot.
        constexpr std::array<std::string_view, 7> kArchiveExtensions{
            ".zip", ".tar", ".gz", ".bz2", ".xz", ".7z", ".rar"};

        template <std::size_t N>
        bool contains(const std::array<std::string_view, N> &table, std::string_view extension)
        {
            const auto lowered = to_lower(extension);
            return std::find(table.begin(), table.end(), lowered) != table.end();
        }
    } // namespace

    std::string to_lower(std::string_view text)
    {
        std::string lowered(text);
        std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return lowered;
    }

    // Case-insensitive like the category checks, so "Main.PY" highlights as python.
    std::string language_for_extension(std::string_view extension)
    {
        const auto lowered = to_lower(extension);
        for (const auto &mapping : kLanguages)
        {
            if (mapping.extension == lowered)
            {
                return std::string(mapping.language);
            }
        }
        return "text";
    }

    bool is_image_extension(std::string_view extension)
    {
        return contains(kImageExtensions, extension);
    }

    bool is_document_extension(std::string_view extension)
    {
        return contains(kDocumentExtensions, extension);
    }

    bool is_archive_extension(std::string_view extension)
    {
        return contains(kArchiveExtensions, extension);
    }

    bool is_code_extension(std::string_view extension)
    {
        const auto lowered = to_lower(extension);
        for (const auto &mapping : kLanguages)
        {
            if (mapping.extension == lowered && mapping.language != "text")
            {
                return true;
            }
        }
        return false;
    }

} // namespace sftpgate::file_types
