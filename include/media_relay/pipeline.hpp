/**
 * @file pipeline.hpp
 * @brief Per-file pipeline driving one ledger record to a terminal state
 *
 * @details FilePipeline runs the stages for one source file:
 *
 *          - Inspect + classify        (DISCOVERED   -> CLASSIFIED | SKIPPED)
 *
 *          - Route, select tracks      (CLASSIFIED   -> REMUXING | TRANSFERRING)
 *
 *          - Remux (stream copy)       (REMUXING     -> TRANSFERRING)
 *
 *          - Transfer + verify         (TRANSFERRING -> VERIFIED)
 *
 *          - Cleanup                   (VERIFIED     -> CLEANED_UP[_PARTIAL])
 *
 *          Every stage ends with a compare-and-set on the ledger. A lost
 *          compare-and-set means another worker owns the record and the
 *          pipeline stops touching it.
 *
 * @note Resuming a record starts at the stage of its current state, so a
 *       crash at any point continues where the ledger says it stopped.
 */

#ifndef MEDIA_RELAY_PIPELINE_HPP
#define MEDIA_RELAY_PIPELINE_HPP

#include <cstdint>
#include <string>

#include "cancellation.hpp"
#include "config.hpp"
#include "container_inspector.hpp"
#include "ledger.hpp"
#include "share_client.hpp"
#include "types.hpp"

namespace media_relay {

/**
 * @struct FileOutcome
 * @brief What happened to one file in one run.
 */
struct FileOutcome {
  std::string source_path;
  int64_t record_id = 0;
  bool recorded = false; //< A ledger record exists for this run
  bool existing = false; //< Record was already handled or in flight
  bool planned = false;  //< Dry run: nothing was written
  PipelineState state = PipelineState::Discovered;
  std::string reason;
  std::string destination;
  int attempts = 0;
  uint64_t bytes = 0;
  long processing_time_us = 0;

  /// Ended in FAILED during this run
  bool failed() const { return !existing && state == PipelineState::Failed; }
};

/**
 * @class FilePipeline
 * @brief Runs files through the stages on behalf of one worker.
 *
 * @attention OWNERSHIP:
 *
 *   - The ShareClient is the worker's session, reused across files
 *
 *   - The Ledger is shared by every worker
 */
class FilePipeline {
  const Settings &settings_;
  Ledger &ledger_;
  ShareClient &client_;
  const CancellationToken *cancel_;
  int worker_id_;
  ContainerInspector inspector_;

  /// Stage-local data that is not persisted
  struct Context {
    MediaFile file;
    bool classified = false;
  };

  void log_info(const std::string &msg) const;
  void log_warn(const std::string &msg) const;
  void log_error(const std::string &msg) const;

  bool cancel_pending(const PipelineRecord &record) const;
  /// CAS to FAILED and drop the remux artifact; false on a lost race
  bool fail(PipelineRecord &record, ErrorKind kind, const std::string &detail);

  /// Inspect and classify the record's source into ctx
  ErrorKind inspect(const PipelineRecord &record, Context &ctx);

  // Each stage returns true when its ledger transition committed
  bool classify_stage(PipelineRecord &record, Context &ctx);
  bool route_stage(PipelineRecord &record, Context &ctx);
  bool remux_stage(PipelineRecord &record, Context &ctx);
  bool transfer_stage(PipelineRecord &record);
  bool cleanup_stage(PipelineRecord &record);

  /// Advance until terminal, VERIFIED with cleanup disabled, or a lost race
  void drive(PipelineRecord &record, Context &ctx);

  FileOutcome outcome_of(const PipelineRecord &record) const;
  FileOutcome plan(const std::string &source_path, uint64_t size);

public:
  FilePipeline(const Settings &settings, Ledger &ledger, ShareClient &client,
               const CancellationToken *cancel = nullptr, int worker_id = -1);

  /**
   * @brief Process a file found by a scan.
   * @note A missing file creates no record. A file whose key already has a
   *       record is not processed again (unless retry of FAILED records is
   *       enabled).
   */
  FileOutcome run(const std::string &source_path);

  /**
   * @brief Continue a record left non-terminal by an earlier run.
   */
  FileOutcome resume(PipelineRecord record);
};

} // namespace media_relay

#endif // MEDIA_RELAY_PIPELINE_HPP
