#pragma once

/// @file archive_outcome_store.hpp
/// @brief OutcomeStore backed by the on-disk comparison archive.
///
/// Layout:
/// @code
///   <root>/<promptset>/comparisons/<a>__vs__<b>.json
/// @endcode
/// where <a> and <b> are the lexicographically sorted model identifiers
/// with ':' and '/' replaced by '_'. Each file holds one comparison run:
/// @code
///   {"model_a": "llama3:8b", "model_b": "mistral:7b",
///    "category_results": {"Reasoning": {"wins_a": 3, "wins_b": 1, "ties": 1}}}
/// @endcode

#include <filesystem>
#include <string>
#include <string_view>
#include <utility>

#include "mrk/foundation/rank_result.hpp"
#include "mrk/store/outcome_store.hpp"

namespace mrk::store {

/// Reads (and writes) comparison runs from an archive directory.
///
/// Malformed outcome files are logged and treated as absent; they never
/// abort a load or a listing.
class ArchiveOutcomeStore : public OutcomeStore {
public:
    explicit ArchiveOutcomeStore(std::filesystem::path root);

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

    /// Directory holding the comparison files of @p promptset.
    [[nodiscard]] std::filesystem::path comparisonsDir(std::string_view promptset) const;

    /// Path of the file that holds (or would hold) the outcome for the pair.
    [[nodiscard]] std::filesystem::path comparisonPath(
        std::string_view modelA, std::string_view modelB, std::string_view promptset) const;

    /// Persist @p outcome, superseding any earlier run for the same pair.
    [[nodiscard]] foundation::RankResult<void> save(
        const PairOutcome& outcome, std::string_view promptset) const;

    [[nodiscard]] std::optional<PairOutcome> load(
        std::string_view modelA, std::string_view modelB, const Scope& scope) const override;

    [[nodiscard]] std::vector<UnorderedPairKey> listAll(const Scope& scope) const override;

    /// Replace the characters that cannot appear in archive file names.
    [[nodiscard]] static std::string sanitizeModelName(std::string_view model);

    /// File name for a pair: "<a>__vs__<b>.json" with the ids sorted.
    [[nodiscard]] static std::string comparisonFileName(std::string_view modelA,
                                                        std::string_view modelB);

    /// Derive the two model identifiers from a comparison file name.
    ///
    /// The mapping is lossy ('_' becomes ':'), so identifiers read from
    /// the file body take precedence wherever the body is readable.
    /// @return InvalidComparisonFilename for names not of the form
    ///         "<a>__vs__<b>.json".
    [[nodiscard]] static foundation::RankResult<std::pair<std::string, std::string>>
    parseComparisonFilename(std::string_view filename);

    /// Parse one outcome file.
    /// @return OutcomeCorrupted when the file is unreadable or malformed.
    [[nodiscard]] static foundation::RankResult<PairOutcome> readOutcomeFile(
        const std::filesystem::path& path);

private:
    std::filesystem::path root_;
};

}  // namespace mrk::store
