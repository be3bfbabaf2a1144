/**
 * @file media_relay.h
 * @brief Main header for the media_relay library
 * @version 0.1.0
 *
 * This is the primary include file for the media_relay library.
 * Include this header to access the transfer engine and its local adapters.
 *
 * @code
 * #include <kcenon/media_relay/media_relay.h>
 *
 * using namespace kcenon::media_relay;
 *
 * auto orchestrator = pipeline_orchestrator::builder()
 *     .with_catalog(catalog)
 *     .with_ledger(ledger)
 *     .with_resume_store(resume)
 *     .with_source(std::make_shared<local_media_source>("drive"))
 *     .with_destination(std::make_shared<local_video_destination>("published"))
 *     .build();
 * @endcode
 */

#ifndef KCENON_MEDIA_RELAY_MEDIA_RELAY_H
#define KCENON_MEDIA_RELAY_MEDIA_RELAY_H

#include <cstdint>
#include <string>

// Core types
#include "kcenon/media_relay/core/types.h"
#include "kcenon/media_relay/core/logging.h"
#include "kcenon/media_relay/core/checksum.h"
#include "kcenon/media_relay/core/json.h"

// State
#include "kcenon/media_relay/storage/state_backend.h"
#include "kcenon/media_relay/catalog/catalog_store.h"
#include "kcenon/media_relay/ledger/completion_ledger.h"
#include "kcenon/media_relay/resume/resume_state_store.h"

// Transfer
#include "kcenon/media_relay/compress/ffmpeg_encoder.h"
#include "kcenon/media_relay/compress/size_adaptive_compressor.h"
#include "kcenon/media_relay/transfer/chunked_downloader.h"
#include "kcenon/media_relay/transfer/chunked_uploader.h"
#include "kcenon/media_relay/transfer/publish_metadata_builder.h"

// Local collaborators
#include "kcenon/media_relay/local/local_media_source.h"
#include "kcenon/media_relay/local/local_video_destination.h"

// Pipeline
#include "kcenon/media_relay/pipeline/pipeline_orchestrator.h"

namespace kcenon::media_relay {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::media_relay

#endif  // KCENON_MEDIA_RELAY_MEDIA_RELAY_H
