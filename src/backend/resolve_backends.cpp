#include "duet/backend/client.hpp"
#include "duet/backend/document_backend.hpp"
#include "duet/backend/sqlite_backend.hpp"
#include "duet/backend/unconfigured_backend.hpp"
#include "duet/log.hpp"

namespace duet {
namespace backend {

Expected<BackendSet> resolve_backends(const Config& config) {
    if (auto valid = config.validate(); !valid) {
        return tl::unexpected(valid.error());
    }

    BackendSet set;
    set.default_backend = config.default_backend;

    if (config.primary_configured()) {
        auto primary = DocumentBackend::open(*config.document_store_path, config.default_page_size);
        if (!primary) {
            return tl::unexpected(primary.error());
        }
        set.primary = *primary;
        DUET_INFO("Primary backend: document store at {}", *config.document_store_path);
    } else {
        set.primary = std::make_shared<UnconfiguredBackend>(BackendKind::Primary);
        DUET_INFO("Primary backend not configured; requests will use the secondary");
    }

    if (config.secondary_configured()) {
        auto secondary = SqliteBackend::open(*config.sqlite_path, config.default_page_size);
        if (!secondary) {
            return tl::unexpected(secondary.error());
        }
        set.secondary = *secondary;
        DUET_INFO("Secondary backend: sqlite at {}", *config.sqlite_path);
    } else {
        set.secondary = std::make_shared<UnconfiguredBackend>(BackendKind::Secondary);
        DUET_INFO("Secondary backend not configured; requests will use the primary");
    }

    if (auto valid = set.validate(); !valid) {
        return tl::unexpected(valid.error());
    }
    DUET_INFO("Default backend: {}", backend_to_string(set.default_backend));
    return set;
}

} // namespace backend
} // namespace duet
