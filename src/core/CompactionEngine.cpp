#include "core/CompactionEngine.hpp"

#include <cstdio>
#include <utility>

#include "core/ConfirmationRenderer.hpp"
#include "core/FidelityGuard.hpp"
#include "filters/BookmarkFilter.hpp"
#include "filters/DiffFilter.hpp"
#include "filters/LogFilter.hpp"
#include "filters/OpLogFilter.hpp"
#include "filters/StatusFilter.hpp"
#include "util/Logger.hpp"
#include "util/TextUtil.hpp"

namespace vcstrim {

namespace {

struct FilterOutput {
    Rendering rendering;
    double unparsedRatio{0.0};
};

FilterOutput runFilter(FilterKind kind, const std::string& text, const FilterConfig& config) {
    FilterOutput out;
    switch (kind) {
        case FilterKind::Status: {
            StatusRecord record = StatusFilter::parse(text);
            out.unparsedRatio = StatusFilter::unparsedRatio(record);
            out.rendering = StatusFilter::format(record, config);
            break;
        }
        case FilterKind::Log: {
            auto parsed = LogFilter::parse(text);
            out.unparsedRatio = parsed.unparsedRatio();
            out.rendering = LogFilter::format(parsed, config);
            break;
        }
        case FilterKind::Diff: {
            DiffRecord record = DiffFilter::parse(text);
            out.unparsedRatio = DiffFilter::unparsedRatio(record);
            out.rendering = DiffFilter::format(record, config);
            break;
        }
        case FilterKind::Show: {
            ShowRecord record = DiffFilter::parseShow(text, config);
            out.unparsedRatio = DiffFilter::unparsedRatio(record);
            out.rendering = DiffFilter::formatShow(record, config);
            break;
        }
        case FilterKind::OpLog: {
            auto parsed = OpLogFilter::parse(text);
            out.unparsedRatio = parsed.unparsedRatio();
            out.rendering = OpLogFilter::format(parsed, config);
            break;
        }
        case FilterKind::BookmarkList: {
            auto parsed = BookmarkFilter::parse(text);
            out.unparsedRatio = parsed.unparsedRatio();
            out.rendering = BookmarkFilter::format(parsed, config);
            break;
        }
    }
    return out;
}

std::string formatRatio(double ratio) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%.2f", ratio);
    return buf;
}

}

CompactionEngine::CompactionEngine(IProcessRunner& runner, std::string binary, FilterConfig config)
    : runner(runner), binary(std::move(binary)), cfg(std::move(config)) {}

std::vector<std::string> CompactionEngine::buildArgv(const Route& route, const Invocation& inv) const {
    std::vector<std::string> argv = {binary, inv.command};
    if (route.kind != RouteKind::Passthrough) {
        bool diffLike = route.kind == RouteKind::StructuredFilter &&
                        (route.filter == FilterKind::Diff || route.filter == FilterKind::Show);
        if (diffLike && !Classifier::hasFlag(inv.args, "--git")) argv.push_back("--git");
        argv.push_back("--color=never");
    }
    argv.insert(argv.end(), inv.args.begin(), inv.args.end());
    return argv;
}

Expected<CompactResult> CompactionEngine::run(const Invocation& inv) const {
    Route route = Classifier::classify(inv.command, inv.args);
    Logger::instance().debug("route " + std::string(Classifier::kindName(route.kind)) + " for '" + route.label + "'" +
                             (route.reason.empty() ? "" : " (" + route.reason + ")"));

    auto argv = buildArgv(route, inv);

    if (route.kind == RouteKind::Passthrough) {
        auto status = runner.interactive(argv);
        if (!status) return status.error();
        Logger::instance().debug("passthrough exited with " + std::to_string(status.value()));
        CompactResult result;
        result.passthrough = true;
        result.exitCode = status.value() < 0 ? 1 : status.value();
        return result;
    }

    auto raw = runner.capture(argv);
    if (!raw) return raw.error();
    Logger::instance().debug("'" + route.label + "' exited with " + std::to_string(raw.value().exitStatus));
    return compact(route, inv, raw.value());
}

CompactResult CompactionEngine::compact(const Route& route, const Invocation& inv, const RawOutput& raw) const {
    if (raw.exitStatus != 0) {
        CompactResult result;
        result.text = raw.stdoutText;
        result.diagnostics = ConfirmationRenderer::failureDiagnostics(route.label, raw);
        result.exitCode = raw.exitStatus > 0 ? raw.exitStatus : 1;
        return result;
    }

    if (route.kind == RouteKind::StructuredFilter) return structured(route, raw);

    CompactResult result;
    if (route.kind == RouteKind::ConfirmationOnly) {
        result.text = ConfirmationRenderer::render(route.write, inv.args, raw, cfg) + "\n";
    } else {
        // Captured passthrough only happens when a caller compacts output it ran itself
        result.text = raw.stdoutText;
        result.diagnostics = raw.stderrText;
        result.passthrough = true;
    }
    return result;
}

CompactResult CompactionEngine::structured(const Route& route, const RawOutput& raw) const {
    FilterOutput out = runFilter(route.filter, raw.stdoutText, cfg);

    if (out.unparsedRatio > cfg.unparsedRatio) {
        return degrade(raw, route.label + ": unparsed ratio " + formatRatio(out.unparsedRatio) + " above " +
                                formatRatio(cfg.unparsedRatio));
    }

    GuardReport report = FidelityGuard::check(out.rendering.sources, out.rendering.text, cfg);
    if (!report.ok) {
        return degrade(raw, route.label + ": identifiers missing from compact output: " +
                                TextUtil::join(report.missing, " "));
    }

    CompactResult result;
    result.text = out.rendering.text + "\n";
    result.diagnostics = raw.stderrText;
    return result;
}

CompactResult CompactionEngine::degrade(const RawOutput& raw, const std::string& reason) {
    Logger::instance().debug("degraded_to_raw=true " + reason);
    CompactResult result;
    result.text = raw.stdoutText;
    result.diagnostics = raw.stderrText;
    result.degradedToRaw = true;
    return result;
}

}
