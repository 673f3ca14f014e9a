#pragma once

#include "client.hpp"

namespace duet {
namespace backend {

/**
 * @brief Stand-in for a backend side that has no configuration.
 *
 * Every data call fails with BackendNotConfigured, which the fallback layer
 * treats as recoverable, so requests transparently land on the other side.
 */
class UnconfiguredBackend : public IRelationalClient {
public:
    explicit UnconfiguredBackend(BackendKind kind)
        : kind_(kind)
    {}

    BackendKind kind() const override { return kind_; }

    std::string name() const override { return "unconfigured"; }

    Expected<void> register_table(const TableHandle&) override {
        return {};
    }

    Expected<std::optional<Record>> get(const std::string&, const RecordId&, const CallContext&) override {
        return tl::unexpected(not_configured());
    }

    Expected<std::vector<Record>> list(const std::string&, const QueryOptions&, const CallContext&) override {
        return tl::unexpected(not_configured());
    }

    Expected<size_t> count(const std::string&, const QueryOptions&, const CallContext&) override {
        return tl::unexpected(not_configured());
    }

    Expected<Record> insert(const std::string&, const Record&, const CallContext&) override {
        return tl::unexpected(not_configured());
    }

    Expected<Record> update(const std::string&, const RecordId&, const Record&, const CallContext&) override {
        return tl::unexpected(not_configured());
    }

    Expected<bool> remove(const std::string&, const RecordId&, const CallContext&) override {
        return tl::unexpected(not_configured());
    }

    Expected<size_t> remove_many(const std::string&, const std::vector<RecordId>&, const CallContext&) override {
        return tl::unexpected(not_configured());
    }

    Expected<std::vector<Record>> raw_query(
        const std::string&, const std::vector<nlohmann::json>&, const CallContext&) override {
        return tl::unexpected(not_configured());
    }

    Expected<void> begin(const CallContext&) override {
        return tl::unexpected(not_configured());
    }

    Expected<void> commit(const CallContext&) override {
        return tl::unexpected(not_configured());
    }

    Expected<void> rollback() override {
        return tl::unexpected(not_configured());
    }

    Expected<Record> upsert(const std::string&, const Record&, const std::string&, const CallContext&) override {
        return tl::unexpected(not_configured());
    }

private:
    Error not_configured() const {
        Error error{
            ErrorCode::BackendNotConfigured,
            std::string("The ") + backend_to_string(kind_) + " backend is not configured"
        };
        error.with_backend(kind_);
        return error;
    }

    BackendKind kind_;
};

} // namespace backend
} // namespace duet
