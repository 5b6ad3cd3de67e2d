#include <argparse/argparse.hpp>
#include <exception>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <crow/json.h>
#include <crow/logging.h>

#include "error.hpp"
#include "guard_config.hpp"
#include "identifier_validator.hpp"
#include "staging_path_guard.hpp"
#include "staging_service.hpp"

using namespace stagegate;

namespace {

void set_log_level(const std::string& log_level) {
    if (log_level == "debug") {
        crow::logger::setLogLevel(crow::LogLevel::Debug);
    } else if (log_level == "info") {
        crow::logger::setLogLevel(crow::LogLevel::Info);
    } else if (log_level == "warning") {
        crow::logger::setLogLevel(crow::LogLevel::Warning);
    } else if (log_level == "error") {
        crow::logger::setLogLevel(crow::LogLevel::Error);
    } else {
        std::cerr << "Invalid log level: " << log_level << ". Using default (warning)." << std::endl;
        crow::logger::setLogLevel(crow::LogLevel::Warning);
    }
}

GuardConfig initializeConfig(const std::string& config_file) {
    try {
        return GuardConfigLoader(config_file).load();
    } catch (const std::exception& e) {
        throw std::runtime_error("Error while loading configuration, Details: " + std::string(e.what()));
    }
}

template<typename T>
int emit(const Result<T>& result) {
    if (!result) {
        const auto& err = result.error();
        if (err.isSecurity()) {
            CROW_LOG_WARNING << "Security rejection: " << err.message;
        }
        std::cout << err.toJson().dump() << std::endl;
        return err.exitCode();
    }
    std::cout << result->toJson().dump() << std::endl;
    return 0;
}

int emitValue(const Result<std::string>& result, const std::string& kind) {
    if (!result) {
        std::cout << result.error().toJson().dump() << std::endl;
        return result.error().exitCode();
    }
    crow::json::wvalue json;
    json["success"] = true;
    json["kind"] = kind;
    json["value"] = *result;
    std::cout << json.dump() << std::endl;
    return 0;
}

int runValidate(const StagingPathGuard& guard, const std::string& kind, const std::string& value) {
    if (kind == "project") {
        return emitValue(IdentifierValidator::validateProjectId(value), kind);
    } else if (kind == "vendor") {
        return emitValue(IdentifierValidator::validateVendorId(value), kind);
    } else if (kind == "repo-url") {
        return emitValue(IdentifierValidator::validateRepoUrl(value), kind);
    } else if (kind == "snapshot-type") {
        return emitValue(IdentifierValidator::validateSnapshotType(value), kind);
    } else if (kind == "filename") {
        return emitValue(guard.sanitizeFilename(value), kind);
    } else if (kind == "encoding") {
        auto encoding = IdentifierValidator::validateEncoding(value);
        if (!encoding) {
            return emitValue(std::move(encoding.error()), kind);
        }
        return emitValue(IdentifierValidator::encodingName(*encoding), kind);
    }
    std::cerr << "Unknown validation kind: " << kind << std::endl;
    return 1;
}

std::string readInputFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Cannot read input file: " + path);
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // namespace

int main(int argc, char* argv[])
{
    argparse::ArgumentParser program("stagegate");

    program.add_argument("-c", "--config")
        .help("Path to the stagegate.yaml configuration file")
        .default_value(std::string("stagegate.yaml"));

    program.add_argument("--log-level")
        .help("Set the log level (debug, info, warning, error)")
        .default_value(std::string("warning"));

    argparse::ArgumentParser upload_cmd("upload");
    upload_cmd.add_description("Upload a file into a project's staging area");
    upload_cmd.add_argument("--project").required().help("Project identifier");
    upload_cmd.add_argument("--file").required().help("Relative filename inside the staging area");
    upload_cmd.add_argument("--encoding").default_value(std::string("utf-8")).help("utf-8 or base64");
    upload_cmd.add_argument("--content").help("Inline file content");
    upload_cmd.add_argument("--input").help("Read file content from this local path");

    argparse::ArgumentParser info_cmd("info");
    info_cmd.add_description("List the files staged for a project");
    info_cmd.add_argument("--project").required().help("Project identifier");

    argparse::ArgumentParser clear_cmd("clear");
    clear_cmd.add_description("Remove all staged files of a project");
    clear_cmd.add_argument("--project").required().help("Project identifier");

    argparse::ArgumentParser delete_cmd("delete");
    delete_cmd.add_description("Delete a project's staging area");
    delete_cmd.add_argument("--project").required().help("Project identifier");

    argparse::ArgumentParser resolve_cmd("resolve");
    resolve_cmd.add_description("Print the safe staging path for a project file");
    resolve_cmd.add_argument("--project").required().help("Project identifier");
    resolve_cmd.add_argument("--file").required().help("Relative filename");

    argparse::ArgumentParser validate_cmd("validate");
    validate_cmd.add_description("Validate a single identifier");
    validate_cmd.add_argument("--kind").required()
        .help("project, vendor, repo-url, snapshot-type, filename or encoding");
    validate_cmd.add_argument("--value").required().help("Value to validate");

    program.add_subparser(upload_cmd);
    program.add_subparser(info_cmd);
    program.add_subparser(clear_cmd);
    program.add_subparser(delete_cmd);
    program.add_subparser(resolve_cmd);
    program.add_subparser(validate_cmd);

    try {
        program.parse_args(argc, argv);
    } catch (const std::runtime_error& err) {
        std::cerr << err.what() << std::endl;
        std::cerr << program;
        return 1;
    }

    set_log_level(program.get<std::string>("--log-level"));

    try {
        auto config = initializeConfig(program.get<std::string>("--config"));
        auto guard = std::make_shared<StagingPathGuard>(config);
        CROW_LOG_DEBUG << "Using staging root " << guard->stagingRoot().string();
        StagingService service(guard, config.max_file_bytes);

        if (program.is_subcommand_used(upload_cmd)) {
            std::string content;
            if (upload_cmd.present("--input")) {
                content = readInputFile(upload_cmd.get<std::string>("--input"));
            } else if (upload_cmd.present("--content")) {
                content = upload_cmd.get<std::string>("--content");
            } else {
                std::cerr << "upload requires --content or --input" << std::endl;
                return 1;
            }
            return emit(service.upload(upload_cmd.get<std::string>("--project"),
                                       upload_cmd.get<std::string>("--file"),
                                       content,
                                       upload_cmd.get<std::string>("--encoding")));
        } else if (program.is_subcommand_used(info_cmd)) {
            return emit(service.stagingInfo(info_cmd.get<std::string>("--project")));
        } else if (program.is_subcommand_used(clear_cmd)) {
            return emit(service.clear(clear_cmd.get<std::string>("--project")));
        } else if (program.is_subcommand_used(delete_cmd)) {
            return emit(service.deleteProject(delete_cmd.get<std::string>("--project")));
        } else if (program.is_subcommand_used(resolve_cmd)) {
            auto path = guard->resolve(resolve_cmd.get<std::string>("--project"),
                                       resolve_cmd.get<std::string>("--file"));
            if (!path) {
                return emitValue(std::move(path.error()), "path");
            }
            return emitValue(path->string(), "path");
        } else if (program.is_subcommand_used(validate_cmd)) {
            return runValidate(*guard,
                               validate_cmd.get<std::string>("--kind"),
                               validate_cmd.get<std::string>("--value"));
        }

        std::cerr << program;
        return 1;
    } catch (const std::exception& e) {
        CROW_LOG_ERROR << e.what();
        std::cout << Error::Config(e.what()).toJson().dump() << std::endl;
        return 3;
    }
}
