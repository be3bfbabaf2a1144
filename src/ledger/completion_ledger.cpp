/**
 * @file completion_ledger.cpp
 * @brief Implementation of completion_ledger
 */

#include <kcenon/media_relay/ledger/completion_ledger.h>
#include <kcenon/media_relay/catalog/item.h>
#include <kcenon/media_relay/core/json.h>
#include <kcenon/media_relay/core/logging.h>

#include <mutex>
#include <set>

namespace kcenon::media_relay {

class completion_ledger::impl {
public:
    impl(std::shared_ptr<state_backend> backend, std::string document)
        : backend_(std::move(backend)), document_(std::move(document)) {}

    auto load() -> result<void> {
        auto content = backend_->read(document_);
        if (!content) {
            return unexpected(content.error());
        }

        std::set<std::string, item_id_less> loaded;
        if (content.value()) {
            auto parsed = json_value::parse(*content.value());
            if (!parsed || !parsed.value().is_array()) {
                auto reason = parsed ? std::string("not a JSON array")
                                     : parsed.error().message;
                MR_LOG_ERROR(log_category::ledger,
                    "Ledger " + backend_->describe(document_) + " is corrupted: " + reason);
                return unexpected(error{error_code::state_corrupted,
                                        "ledger corrupted: " + reason});
            }
            for (const auto& entry : parsed.value().as_array()) {
                auto text = entry.scalar_text();
                if (text && !text->empty()) {
                    loaded.insert(std::move(*text));
                }
            }
        }

        std::lock_guard lock(mutex_);
        ids_ = std::move(loaded);
        MR_LOG_INFO(log_category::ledger,
            "Loaded " + std::to_string(ids_.size()) + " previously published item IDs");
        return {};
    }

    auto contains(std::string_view id) const -> bool {
        std::lock_guard lock(mutex_);
        return ids_.find(std::string(id)) != ids_.end();
    }

    auto add(std::string_view id) -> result<void> {
        std::lock_guard lock(mutex_);
        auto [it, inserted] = ids_.insert(std::string(id));
        if (!inserted) {
            return {};
        }

        auto persisted = persist_locked();
        if (!persisted) {
            ids_.erase(it);
            MR_LOG_ERROR(log_category::ledger,
                "Failed to persist ledger entry " + std::string(id) + ": " +
                persisted.error().message);
            return persisted;
        }

        MR_LOG_DEBUG(log_category::ledger, "Recorded published item " + std::string(id));
        return {};
    }

    auto ids() const -> std::vector<std::string> {
        std::lock_guard lock(mutex_);
        return {ids_.begin(), ids_.end()};
    }

    auto size() const -> std::size_t {
        std::lock_guard lock(mutex_);
        return ids_.size();
    }

private:
    auto persist_locked() -> result<void> {
        auto doc = json_value::make_array();
        for (const auto& id : ids_) {
            doc.push_back(json_value::make_string(id));
        }
        return backend_->write(document_, doc.dump());
    }

    std::shared_ptr<state_backend> backend_;
    std::string document_;
    mutable std::mutex mutex_;
    std::set<std::string, item_id_less> ids_;
};

completion_ledger::completion_ledger(std::shared_ptr<state_backend> backend,
                                     std::string document)
    : impl_(std::make_unique<impl>(std::move(backend), std::move(document))) {}

completion_ledger::~completion_ledger() = default;

completion_ledger::completion_ledger(completion_ledger&&) noexcept = default;
auto completion_ledger::operator=(completion_ledger&&) noexcept -> completion_ledger& = default;

auto completion_ledger::load() -> result<void> {
    return impl_->load();
}

auto completion_ledger::contains(std::string_view id) const -> bool {
    return impl_->contains(id);
}

auto completion_ledger::add(std::string_view id) -> result<void> {
    return impl_->add(id);
}

auto completion_ledger::ids() const -> std::vector<std::string> {
    return impl_->ids();
}

auto completion_ledger::size() const -> std::size_t {
    return impl_->size();
}

}  // namespace kcenon::media_relay
