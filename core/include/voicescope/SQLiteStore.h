#pragma once

#include "voicescope/DeliveryTypes.h"

#include <sqlite3.h>

#include <optional>
#include <string>
#include <vector>

namespace voicescope {

/**
 * SQLiteStore: evaluation history (reports only, never audio)
 *
 * One connection per store; not shared across threads.
 */
class SQLiteStore {
  public:
    explicit SQLiteStore(const std::string& path);
    ~SQLiteStore();

    SQLiteStore(const SQLiteStore&) = delete;
    SQLiteStore& operator=(const SQLiteStore&) = delete;

    void initialize();

    // Upsert by clipId; replaces metrics, segments and issues of an existing clip.
    void save_report(const DeliveryReport& report);

    std::optional<DeliveryMetrics> load_metrics(const std::string& clipId) const;
    std::vector<ClipSummary> list_clips() const;

    // @return false if no clip with this id was stored
    bool delete_clip(const std::string& clipId);

  private:
    sqlite3* db_{nullptr};
};

}  // namespace voicescope
