/**
 * @file completion_ledger.h
 * @brief Persisted set of published item identifiers
 */

#ifndef KCENON_MEDIA_RELAY_LEDGER_COMPLETION_LEDGER_H
#define KCENON_MEDIA_RELAY_LEDGER_COMPLETION_LEDGER_H

#include <kcenon/media_relay/core/types.h>
#include <kcenon/media_relay/storage/state_backend.h>

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::media_relay {

/**
 * @brief Record of items already published to the destination
 *
 * The ledger is the single source of truth for "done". Every add() is
 * persisted before it returns; if persisting fails the in-memory set is
 * rolled back so memory and storage never disagree.
 *
 * Persisted form is a JSON array of identifier strings.
 */
class completion_ledger {
public:
    static constexpr const char* default_document = "used_recipes.json";

    /**
     * @brief Construct over a state backend
     * @param backend Storage for the ledger document
     * @param document Document name within the backend
     */
    explicit completion_ledger(std::shared_ptr<state_backend> backend,
                               std::string document = default_document);
    ~completion_ledger();

    completion_ledger(const completion_ledger&) = delete;
    auto operator=(const completion_ledger&) -> completion_ledger& = delete;
    completion_ledger(completion_ledger&&) noexcept;
    auto operator=(completion_ledger&&) noexcept -> completion_ledger&;

    /**
     * @brief Load the ledger; a missing document is an empty ledger
     * @return Success, or state_corrupted if the document is malformed
     */
    [[nodiscard]] auto load() -> result<void>;

    [[nodiscard]] auto contains(std::string_view id) const -> bool;

    /**
     * @brief Add an identifier and persist
     *
     * Adding an identifier that is already present succeeds without a write.
     * @return Success or state_write_error (the addition is rolled back)
     */
    [[nodiscard]] auto add(std::string_view id) -> result<void>;

    /**
     * @brief All identifiers in item order
     */
    [[nodiscard]] auto ids() const -> std::vector<std::string>;

    [[nodiscard]] auto size() const -> std::size_t;

private:
    class impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::media_relay

#endif  // KCENON_MEDIA_RELAY_LEDGER_COMPLETION_LEDGER_H
