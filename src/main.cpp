#include "app/bootstrap.hpp"
#include "config/config.hpp"
#include "core/answer.hpp"
#include "core/errors.hpp"
#include "http/internal_server.hpp"
#include "storage/minio_client.hpp"
#include "util/log.hpp"
#include "worker/ingest_executor.hpp"
#include "version.hpp"

#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace verirag {
namespace {

struct CliOptions {
    std::optional<std::string> ask_question;
    std::string type;
    std::optional<std::string> version;
    std::string mode;
    std::string ingest_file;
    std::string doc_id;
    std::string doc_name;
    std::string soft_delete_id;
    std::string restore_id;
    bool serve = false;
    bool ingest_worker = false;
};

void print_usage() {
    std::cerr << "usage: verirag --ask <question> [--type sales|technical|general] [--version <v>]\n"
                 "                     [--mode brief|standard|deep]\n"
                 "       verirag --ingest-file <path> --doc-id <id> --version <v> [--name <name>]\n"
                 "       verirag --soft-delete <id>\n"
                 "       verirag --restore <id>\n"
                 "       verirag --serve\n"
                 "       verirag --ingest-worker\n";
}

// Returns std::nullopt after logging when the arguments are unusable.
std::optional<CliOptions> parse_arguments(int argc, char** argv) {
    CliOptions options;
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg{argv[i]};
        const auto value = [&]() -> std::optional<std::string> {
            if (i + 1 >= argc) {
                log::error(std::string{arg} + " requires a value");
                return std::nullopt;
            }
            return std::string{argv[++i]};
        };

        std::optional<std::string> parsed;
        if (arg == "--serve") {
            options.serve = true;
            continue;
        }
        if (arg == "--ingest-worker") {
            options.ingest_worker = true;
            continue;
        }
        if (!(parsed = value())) {
            return std::nullopt;
        }
        if (arg == "--ask") {
            options.ask_question = *parsed;
        } else if (arg == "--type") {
            options.type = *parsed;
        } else if (arg == "--version") {
            options.version = *parsed;
        } else if (arg == "--mode") {
            options.mode = *parsed;
        } else if (arg == "--ingest-file") {
            options.ingest_file = *parsed;
        } else if (arg == "--doc-id") {
            options.doc_id = *parsed;
        } else if (arg == "--name") {
            options.doc_name = *parsed;
        } else if (arg == "--soft-delete") {
            options.soft_delete_id = *parsed;
        } else if (arg == "--restore") {
            options.restore_id = *parsed;
        } else {
            log::error("unknown argument: " + std::string{arg});
            return std::nullopt;
        }
    }

    const int modes = (options.ask_question ? 1 : 0) + (!options.ingest_file.empty() ? 1 : 0) +
                      (!options.soft_delete_id.empty() ? 1 : 0) + (!options.restore_id.empty() ? 1 : 0) +
                      (options.serve ? 1 : 0) + (options.ingest_worker ? 1 : 0);
    if (modes != 1) {
        log::error("exactly one of --ask, --ingest-file, --soft-delete, --restore, --serve, --ingest-worker is required");
        return std::nullopt;
    }
    return options;
}

std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw InvalidRequest("cannot open file: " + path);
    }
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}

std::string file_name(const std::string& path) {
    const auto slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

int run_ask(RagService& rag, const CliOptions& options) {
    const Query query{
        .question = *options.ask_question,
        .type = parse_query_type(options.type),
        .version = options.version,
        .mode = parse_answer_mode(options.mode),
    };
    const Answer answer = rag.ask(query);

    std::cout << "Answer:\n" << answer.text << "\n\n";
    std::cout << "Confidence: " << answer.confidence << "\n";
    std::cout << "Sources:\n";
    if (answer.sources.empty()) {
        std::cout << "- (no sources)\n";
    }
    for (const auto& source : answer.sources) {
        std::cout << "- [S" << source.marker << "] " << source.document_name << " (" << source.version
                  << ") chunk " << source.seq_no << " score=" << source.score << "\n"
                  << "  " << source.quote << "\n";
    }
    return 0;
}

int run_ingest_file(RagService& rag, const CliOptions& options) {
    if (options.doc_id.empty() || !options.version) {
        log::error("--ingest-file requires --doc-id and --version");
        return 1;
    }
    const std::string name = options.doc_name.empty() ? file_name(options.ingest_file) : options.doc_name;
    const int chunks = rag.ingest(options.doc_id, name, *options.version, read_file(options.ingest_file));
    std::cout << "document_id=" << options.doc_id << " version=" << *options.version << " chunks_indexed=" << chunks
              << "\n";
    return 0;
}

int run_document_flag(RagService& rag, const std::string& document_id, bool deleted) {
    const bool found = deleted ? rag.soft_delete(document_id) : rag.restore(document_id);
    if (!found) {
        log::error("unknown document: " + document_id);
        return 1;
    }
    std::cout << "document_id=" << document_id << " deleted=" << (deleted ? "true" : "false") << "\n";
    return 0;
}

int run(const Config& config, const CliOptions& options) {
    const auto app = bootstrap(config);
    RagService& rag = *app->rag;

    if (options.serve) {
        return run_http_server(rag, config.http_host(), config.http_port());
    }
    if (options.ingest_worker) {
        MinioClient store(config.minio_endpoint(), config.minio_bucket(), config.minio_root_user(),
                          config.minio_root_password());
        return run_ingest_executor(config, rag, store);
    }
    if (options.ask_question) {
        return run_ask(rag, options);
    }
    if (!options.ingest_file.empty()) {
        return run_ingest_file(rag, options);
    }
    if (!options.soft_delete_id.empty()) {
        return run_document_flag(rag, options.soft_delete_id, true);
    }
    return run_document_flag(rag, options.restore_id, false);
}

}  // namespace
}  // namespace verirag

int main(int argc, char** argv) {
    const auto options = verirag::parse_arguments(argc, argv);
    if (!options) {
        verirag::print_usage();
        return 1;
    }

    try {
        verirag::log::info(std::string{"verirag starting (version "} + verirag::kVersion + ')');
        const auto config = verirag::Config::load();
        return verirag::run(config, *options);
    } catch (const verirag::InvalidRequest& ex) {
        verirag::log::error(std::string{"invalid request: "} + ex.what());
        return 1;
    } catch (const verirag::InvalidVersionFilter& ex) {
        verirag::log::error(std::string{"invalid version: "} + ex.what());
        return 1;
    } catch (const std::exception& ex) {
        verirag::log::error(std::string{"fatal error: "} + ex.what());
        return 2;
    }
}
