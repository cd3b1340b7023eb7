#include "hubxfer/config.hpp"
#include "hubxfer/hub_client.hpp"
#include "hubxfer/log.hpp"
#include "hubxfer/reporter.hpp"
#include "hubxfer/transfer_orchestrator.hpp"
#include <charconv>
#include <chrono>
#include <format>
#include <optional>
#include <string>
#include <vector>

using namespace hubxfer;

enum class FSMState {
    Init,
    ParseArgs,
    PreCommand,
    RunCommand,
    PostCommand,
    Error,
    Done
};

struct CliFlags {
    std::string repo_type = "auto";
    std::string src_endpoint = "hf";
    std::optional<std::string> target_endpoint;
    std::optional<std::string> src_token, target_token, hf_token, token;
    std::optional<std::string> revision;
    std::optional<size_t> threads, retries, max_consecutive_failures;
    std::optional<long> timeout;
    bool include_lfs = true;
    bool is_private = false;
    bool force = false;
    bool verbose = false;
    OutputMode output = OutputMode::Text;
};

struct FSMContext {
    int argc;
    char** argv;
    std::string cmd;
    std::vector<std::string> args;
    CliFlags flags;
    TransferSession session;
    int exit_code = 0;
    std::string error_message;
    bool show_usage = false;
    std::chrono::steady_clock::time_point start_time;
};

void print_usage(const char* program_name) {
    log::Writer::print(std::format(
        "Hub-to-hub repository transfer (C++23)\n\n"
        "Usage: {} transfer <source-repo> <dest-repo> [options]\n\n"
        "Options:\n"
        "  --repo-type <model|dataset|space|auto>  Repository type (default: auto)\n"
        "  --src-endpoint <url|hf>                 Source hub (default: hf)\n"
        "  --target-endpoint <url|hf>              Target hub (default: HF_ENDPOINT or config)\n"
        "  --src-token <token>                     Source hub token\n"
        "  --target-token <token>                  Target hub token\n"
        "  --hf-token <token>                      Token for huggingface.co\n"
        "  --token <token>                         Token for both sides (default: HF_TOKEN)\n"
        "  --include-lfs / --no-include-lfs        Transfer large binary files (default: on)\n"
        "  --private                               Create the destination as private\n"
        "  --force                                 Upload into an existing destination\n"
        "  --revision <rev>                        Source revision (default: main)\n"
        "  --threads <n>                           Parallel file transfers (default: 4)\n"
        "  --retries <n>                           Retries per file on network errors, max 20 (default: 2)\n"
        "  --timeout <seconds>                     Per-file request timeout (default: 3600)\n"
        "  --max-consecutive-failures <n>          Abort after n failures in a row (default: off)\n"
        "  --output <text|json>                    Output format (default: text)\n"
        "  -v, --verbose                           Show per-file progress\n",
        program_name));
}

template<typename T>
std::optional<T> parse_number(std::string_view s) {
    T value{};
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
    return value;
}

// Returns an error message, or empty on success
std::string parse_flags(FSMContext& ctx) {
    auto& f = ctx.flags;
    for (int i = 2; i < ctx.argc; ++i) {
        std::string a = ctx.argv[i];
        auto value = [&]() -> std::optional<std::string> {
            if (i + 1 >= ctx.argc) return std::nullopt;
            return std::string(ctx.argv[++i]);
        };
        auto number = [&]<typename T>(std::optional<T>& out) -> bool {
            auto v = value();
            if (!v) return false;
            out = parse_number<T>(*v);
            return out.has_value();
        };

        if (a == "--include-lfs") f.include_lfs = true;
        else if (a == "--no-include-lfs") f.include_lfs = false;
        else if (a == "--private") f.is_private = true;
        else if (a == "--force") f.force = true;
        else if (a == "--verbose" || a == "-v") f.verbose = true;
        else if (a == "--threads") { if (!number(f.threads)) return "--threads requires a number"; }
        else if (a == "--retries") { if (!number(f.retries)) return "--retries requires a number"; }
        else if (a == "--timeout") { if (!number(f.timeout)) return "--timeout requires a number of seconds"; }
        else if (a == "--max-consecutive-failures") {
            if (!number(f.max_consecutive_failures)) return "--max-consecutive-failures requires a number";
        }
        else if (a.starts_with("--")) {
            auto v = value();
            if (!v) return std::format("{} requires a value", a);
            if (a == "--repo-type") f.repo_type = *v;
            else if (a == "--src-endpoint") f.src_endpoint = *v;
            else if (a == "--target-endpoint") f.target_endpoint = *v;
            else if (a == "--src-token") f.src_token = *v;
            else if (a == "--target-token") f.target_token = *v;
            else if (a == "--hf-token") f.hf_token = *v;
            else if (a == "--token") f.token = *v;
            else if (a == "--revision") f.revision = *v;
            else if (a == "--output") {
                if (*v == "json") f.output = OutputMode::Json;
                else if (*v == "text") f.output = OutputMode::Text;
                else return std::format("Unknown output format: {}", *v);
            }
            else return std::format("Unknown option: {}", a);
        }
        else ctx.args.push_back(a);
    }
    return {};
}

// Turns flags and configuration into a session; engine code never reads either
std::expected<TransferSession, TransferErrorInfo> build_session(const FSMContext& ctx, const Config& config) {
    const auto& f = ctx.flags;
    auto invalid = [](std::string message) {
        return std::unexpected(TransferErrorInfo{TransferError::InvalidArgument, std::move(message), std::nullopt});
    };

    TransferSession s;
    auto src = RepoRef::parse(ctx.args[0]);
    if (!src) return invalid(std::format("Invalid source repo_id: '{}'", ctx.args[0]));
    auto dst = RepoRef::parse(ctx.args[1]);
    if (!dst) return invalid(std::format("Invalid destination repo_id: '{}'", ctx.args[1]));

    s.source = RepoSide{*src, Endpoint::from_spec(f.src_endpoint)};
    s.dest = RepoSide{*dst, Endpoint::from_spec(f.target_endpoint.value_or(config.endpoint()))};

    s.credentials.src_token = f.src_token;
    s.credentials.target_token = f.target_token;
    s.credentials.reference_hub_token = f.hf_token;
    s.credentials.fallback_token = f.token ? f.token : config.token();

    auto& o = s.options;
    if (f.repo_type != "auto") {
        auto kind = parse_repo_kind(f.repo_type);
        if (!kind) return invalid(std::format("Unknown repository type: {}", f.repo_type));
        o.repo_type_override = *kind;
    }
    o.include_large_objects = f.include_lfs;
    o.force_overwrite = f.force;
    o.private_repo = f.is_private;
    o.output_mode = f.output;
    o.verbosity = f.verbose ? 1 : 0;
    if (f.revision) o.revision = *f.revision;
    if (auto t = f.threads ? f.threads : config.threads()) o.parallelism = *t;
    if (f.retries) {
        if (*f.retries > kMaxRetries) return invalid(std::format("--retries must be at most {}", kMaxRetries));
        o.max_retries = *f.retries;
    }
    if (f.timeout) o.file_timeout_seconds = *f.timeout;
    if (f.max_consecutive_failures) o.max_consecutive_failures = *f.max_consecutive_failures;
    if (const auto& exts = config.large_object_extensions()) o.large_object_extensions = *exts;
    return s;
}

int cmd_transfer(const TransferSession& session) {
    BackendRegistry registry;
    register_default_backends(registry);

    auto reporter = Reporter::make(session.options.output_mode, session.options.verbosity > 0);
    TransferOrchestrator orchestrator(registry, reporter.get());

    auto outcome = orchestrator.run(session);
    if (!outcome) {
        reporter->report_error(outcome.error());
        return exit_code(outcome.error().error);
    }
    reporter->report(session, *outcome);
    return outcome->aborted() ? 1 : 0;
}

int main(int argc, char** argv) {
    FSMState state = FSMState::Init;
    FSMContext ctx{argc, argv};
    while (state != FSMState::Done) {
        switch (state) {
            case FSMState::Init:
                ctx.start_time = std::chrono::steady_clock::now();
                if (ctx.argc < 2) {
                    ctx.exit_code = 1;
                    ctx.show_usage = true;
                    state = FSMState::Error;
                } else {
                    ctx.cmd = ctx.argv[1];
                    state = FSMState::ParseArgs;
                }
                break;
            case FSMState::ParseArgs:
                if (ctx.cmd == "help" || ctx.cmd == "--help" || ctx.cmd == "-h") {
                    print_usage(ctx.argv[0]);
                    state = FSMState::Done;
                    break;
                }
                ctx.error_message = parse_flags(ctx);
                if (!ctx.error_message.empty()) {
                    ctx.exit_code = 1;
                    ctx.show_usage = true;
                    state = FSMState::Error;
                    break;
                }
                log::Writer::set_level(ctx.flags.output == OutputMode::Json ? log::Level::Quiet
                                       : ctx.flags.verbose ? log::Level::Verbose : log::Level::Normal);
                state = FSMState::PreCommand;
                break;
            case FSMState::PreCommand: {
                if (ctx.cmd != "transfer") {
                    ctx.exit_code = 1;
                    ctx.error_message = "Unknown command: " + ctx.cmd;
                    ctx.show_usage = true;
                    state = FSMState::Error;
                    break;
                }
                if (ctx.args.size() != 2) {
                    ctx.exit_code = 1;
                    ctx.error_message = "transfer requires <source-repo> and <dest-repo> arguments.";
                    ctx.show_usage = true;
                    state = FSMState::Error;
                    break;
                }
                auto session = build_session(ctx, Config::load());
                if (!session) {
                    Reporter::make(ctx.flags.output, false)->report_error(session.error());
                    ctx.exit_code = exit_code(session.error().error);
                    state = FSMState::Done;
                    break;
                }
                ctx.session = std::move(*session);
                state = FSMState::RunCommand;
                break;
            }
            case FSMState::RunCommand:
                ctx.exit_code = cmd_transfer(ctx.session);
                state = FSMState::PostCommand;
                break;
            case FSMState::PostCommand: {
                auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now() - ctx.start_time).count();
                log::debug("Elapsed: {} ms", ms);
                state = FSMState::Done;
                break;
            }
            case FSMState::Error:
                if (!ctx.error_message.empty()) log::error("Error: {}", ctx.error_message);
                if (ctx.show_usage) print_usage(ctx.argv[0]);
                state = FSMState::Done;
                break;
            case FSMState::Done:
                break;
        }
    }
    return ctx.exit_code;
}
