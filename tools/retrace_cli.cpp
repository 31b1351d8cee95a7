#include <retrace/Retrace.hpp>

#include "log/TaggedLogger.hpp"
#include "utils/FileUtils.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

using namespace RT;

namespace {

struct CliOptions {
    Config::RetraceOptions               config;
    std::optional<std::filesystem::path> image;
    std::optional<std::filesystem::path> stack;
    std::optional<std::filesystem::path> out;
    std::optional<std::size_t>           undo;
};

void print_usage() {
    std::cout << "Usage: retrace_cli --image <file> --stack <json> --out <png> [--undo <n>] [options]\n"
              << "  --image <file>          Source image (png, jpeg, bmp, gif, tga)\n"
              << "  --stack <json>          File holding the serialized action stack\n"
              << "  --out <png>             Where to write the resolved image\n"
              << "  --undo <n>              Keep only the first n actions before resolving\n";
    Config::PrintRetraceOptionsUsage();
}

auto parse_cli(int argc, char** argv) -> std::optional<CliOptions> {
    CliOptions options{};
    if (!Config::ApplyRetraceEnvOverrides(options.config)) {
        return std::nullopt;
    }

    auto require_value = [&](int& index, std::string_view flag) -> std::optional<std::string_view> {
        if (index + 1 >= argc) {
            std::cerr << flag << " requires a value\n";
            return std::nullopt;
        }
        return std::string_view{argv[++index]};
    };

    for (int i = 1; i < argc; ++i) {
        std::string_view arg{argv[i]};
        if (arg == "--image" || arg == "--stack" || arg == "--out") {
            auto value = require_value(i, arg);
            if (!value || value->empty()) {
                std::cerr << arg << " requires a path\n";
                return std::nullopt;
            }
            std::filesystem::path path{std::string{*value}};
            if (arg == "--image") {
                options.image = std::move(path);
            } else if (arg == "--stack") {
                options.stack = std::move(path);
            } else {
                options.out = std::move(path);
            }
        } else if (arg == "--undo") {
            auto value = require_value(i, arg);
            if (!value) {
                return std::nullopt;
            }
            try {
                std::size_t consumed = 0;
                auto        parsed   = std::stoull(std::string{*value}, &consumed);
                if (consumed != value->size()) {
                    std::cerr << "--undo must be a non-negative integer\n";
                    return std::nullopt;
                }
                options.undo = static_cast<std::size_t>(parsed);
            } catch (std::exception const&) {
                std::cerr << "--undo must be a non-negative integer\n";
                return std::nullopt;
            }
        } else {
            auto handled = Config::TryParseRetraceFlag(options.config, argc, argv, i);
            if (!handled.has_value()) {
                std::cerr << "retrace_cli: unknown argument '" << arg << "'\n";
                return std::nullopt;
            }
            if (!*handled) {
                return std::nullopt;
            }
        }
    }

    if (auto error = Config::ValidateRetraceOptions(options.config)) {
        std::cerr << *error << "\n";
        return std::nullopt;
    }
    return options;
}

auto fail(std::string_view what, Error const& error) -> int {
    std::cerr << "retrace_cli: " << what << ": " << describeError(error) << "\n";
    return EXIT_FAILURE;
}

} // namespace

int main(int argc, char** argv) {
    auto cli = parse_cli(argc, argv);
    if (!cli) {
        print_usage();
        return EXIT_FAILURE;
    }
    if (cli->config.show_help) {
        print_usage();
        return EXIT_SUCCESS;
    }
    if (!cli->image || !cli->stack || !cli->out) {
        std::cerr << "retrace_cli: --image, --stack and --out are required\n";
        print_usage();
        return EXIT_FAILURE;
    }

#ifdef RT_LOG_DEBUG
    set_thread_name("Main");
    configure_log_filters_from_env();
    set_logging_enabled(cli->config.log_enabled);
#endif

    auto imageBytes = FileUtils::readBinaryFile(*cli->image);
    if (!imageBytes) {
        return fail("reading image", imageBytes.error());
    }
    if (!imageBytes->has_value()) {
        std::cerr << "retrace_cli: no such file " << cli->image->string() << "\n";
        return EXIT_FAILURE;
    }
    auto stackText = FileUtils::readTextFile(*cli->stack);
    if (!stackText) {
        return fail("reading stack", stackText.error());
    }

    auto cache = std::make_shared<Cache::ReplayCache>(Config::makeCacheBackend(cli->config),
                                                      Config::makeReplayCacheOptions(cli->config));
    Service::EditService service{cache,
                                 std::make_shared<Ops::PixelOperationAdapter>(),
                                 Config::makeSessionConfig(cli->config)};

    auto const& raw = **imageBytes;
    auto        session =
        service.resetSession(std::span<const std::uint8_t>{reinterpret_cast<std::uint8_t const*>(raw.data()), raw.size()});
    if (!session) {
        return fail("opening session", session.error());
    }
    if (auto replaced = service.replaceStack(*session, *stackText); !replaced) {
        return fail("loading stack", replaced.error());
    }
    if (cli->undo) {
        if (auto truncated = service.truncate(*session, *cli->undo); !truncated) {
            return fail("undo", truncated.error());
        }
    }

    auto resolved = service.resolve(*session);
    if (!resolved) {
        return fail("resolving", resolved.error());
    }
    for (auto const& warning : resolved->warnings) {
        std::cerr << "retrace_cli: warning: " << describeError(warning) << "\n";
    }

    auto png = Image::encodePng(*resolved->buffer);
    if (!png) {
        return fail("encoding", png.error());
    }
    auto written = FileUtils::writeFileAtomic(
        *cli->out, std::as_bytes(std::span<const std::uint8_t>{png->data(), png->size()}), false);
    if (!written) {
        return fail("writing output", written.error());
    }

    auto const stats = cache->stats();
    std::cout << "Resolved " << resolved->stackLength << " actions in "
              << std::chrono::duration<double, std::milli>(resolved->resolveTime).count() << " ms ("
              << resolved->computedPrefixes << " computed)\n"
              << "Cache: ram hits " << stats.ramHits << ", backend hits " << stats.backendHits << ", computations "
              << stats.computations << ", write errors " << stats.backendWriteErrors << "\n";

    if (auto closed = service.closeSession(*session); !closed) {
        return fail("closing session", closed.error());
    }
#ifdef RT_LOG_DEBUG
    flush_log();
#endif
    return EXIT_SUCCESS;
}
