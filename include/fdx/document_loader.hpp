#pragma once

/// @file include/fdx/document_loader.hpp
/// @brief Plain-text document loader for the CLI.
///
/// # Module: DocumentLoader
///
/// ## Responsibility
/// Read an already-extracted proposal or terms-of-reference document (UTF-8
/// text) from disk or a stream. Binary formats are converted upstream.
///
/// ## Guarantees
/// - Never throws; returns `nullopt` when the source cannot be read
/// - A leading UTF-8 byte-order mark is removed
/// - Content is returned byte-for-byte otherwise; UTF-8 validity is checked
///   by `Engine::validate_input`, not here

#include <cstddef>
#include <istream>
#include <optional>
#include <string>
#include <string_view>

namespace fdx {

class DocumentLoader {
public:
    /// Upper bound on the size of a loaded document.
    static constexpr std::size_t MAX_DOCUMENT_BYTES = 64U * 1024U * 1024U;

    /// Load a text file.
    ///
    /// # Returns
    /// - `nullopt` if the file cannot be opened, cannot be read, or exceeds
    ///   `MAX_DOCUMENT_BYTES`
    /// - The file contents (possibly empty) otherwise
    [[nodiscard]] static std::optional<std::string>
    load_text(const std::string& filepath) noexcept;

    /// Read a stream to EOF. `nullopt` on a read error or oversize input.
    [[nodiscard]] static std::optional<std::string>
    read_stream(std::istream& in) noexcept;

    /// `content` without a leading UTF-8 BOM.
    [[nodiscard]] static std::string_view strip_bom(std::string_view content) noexcept;
};

}  // namespace fdx
