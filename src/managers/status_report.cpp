#include "status_report.hpp"
#include "transfer_ledger.hpp"
#include <core/constants.hpp>
#include <core/unit.hpp>
#include <fmt/format.h>

namespace fs = std::filesystem;

Result<StatusReport> collect_status(const Config& config) {
    const auto& top_outdir = config.local().top_outdir;
    if (top_outdir.empty()) {
        return Result<StatusReport>::Err(ErrorKind::ConfigurationInvalid,
                                         "local.top_outdir is required");
    }
    fs::path top = top_outdir;
    std::error_code ec;
    if (!fs::is_directory(top, ec)) {
        return Result<StatusReport>::Err(ErrorKind::ConfigurationInvalid,
                                         fmt::format("local.top_outdir {} is not a directory",
                                                     top.string()));
    }

    auto ledger = TransferLedger(top / TRANSFER_LEDGER_FILE).read();
    if (ledger.is_err()) return Result<StatusReport>::Err(ledger.kind, ledger.error);

    StatusReport report;
    CompletionTracker tracker;
    for (const auto& unit : discover_units(top)) {
        UnitStatus s;
        s.key = unit.key;
        s.stage = tracker.classify(unit);
        s.transferred = ledger.value.count(unit.key) > 0;
        report.counts[s.stage]++;
        if (s.transferred) report.transferred++;
        report.units.push_back(s);
    }
    return Result<StatusReport>::Ok(report);
}
