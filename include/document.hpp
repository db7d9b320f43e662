/**
 * @file document.hpp
 * @brief Reading and writing TOML, JSON and YAML files as JSON trees.
 *
 * Settings and registry files share these helpers so every supported format
 * is handled by the same code path.
 */
#ifndef GITFINDR_DOCUMENT_HPP
#define GITFINDR_DOCUMENT_HPP

#include <filesystem>
#include <nlohmann/json_fwd.hpp>

namespace gitfindr {

/// On-disk formats understood by read_document() and write_document().
enum class DocumentFormat { Toml, Json, Yaml };

/// How YAML and TOML scalars are mapped to JSON values.
enum class ScalarMode {
  Infer,   ///< Convert scalars that look like booleans or numbers
  Verbatim ///< Keep every scalar as a string
};

/**
 * Determine the format from the file extension.
 *
 * @param path File path; `.toml`, `.tml`, `.json`, `.yaml` and `.yml` are
 *        recognised case-insensitively.
 * @return Matching format.
 * @throws std::runtime_error For unknown or missing extensions.
 */
DocumentFormat document_format_from_path(const std::filesystem::path &path);

/**
 * Parse a structured file into a JSON tree.
 *
 * @param path File to read.
 * @param mode Scalar handling for YAML and TOML; JSON keeps its own types.
 * @return Parsed document.
 * @throws std::runtime_error When the file cannot be opened or parsed.
 */
nlohmann::json read_document(const std::filesystem::path &path,
                             ScalarMode mode = ScalarMode::Infer);

/**
 * Write a JSON tree to @p path in the format implied by its extension.
 *
 * @param path Destination file, replaced if it exists.
 * @param doc Document to write; TOML requires an object at the top level.
 * @throws std::runtime_error When the file cannot be written or the document
 *         cannot be represented in the target format.
 */
void write_document(const std::filesystem::path &path,
                    const nlohmann::json &doc);

} // namespace gitfindr

#endif // GITFINDR_DOCUMENT_HPP
