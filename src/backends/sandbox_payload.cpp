#include "sandbox_payload.h"
#include "errors.h"
#include "util.h"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <filesystem>

namespace fs = std::filesystem;

namespace agentrun {

namespace {

void write_private_file(const std::string& path, const std::string& content) {
    int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
    if (fd < 0) {
        throw ProvisionError("cannot write " + path + ": " + strerror(errno));
    }

    size_t written = 0;
    while (written < content.size()) {
        ssize_t n = write(fd, content.data() + written, content.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            close(fd);
            throw ProvisionError("cannot write " + path + ": " + strerror(err));
        }
        written += n;
    }
    close(fd);
}

} // namespace

void write_payload_files(const std::string& dir, const SandboxPayload& payload) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw ProvisionError("cannot create " + dir + ": " + ec.message());
    }
    chmod(dir.c_str(), 0700);

    write_private_file(dir + "/prompt.txt", payload.prompt);
    write_private_file(dir + "/agent_config.json",
                       to_json(payload.agent_config.isNull()
                                   ? Json::Value(Json::objectValue)
                                   : payload.agent_config));
    write_private_file(dir + "/repo_url.txt", payload.repo_url);
}

std::map<std::string, std::string> payload_environment(const std::string& dir,
                                                       const SandboxPayload& payload,
                                                       const BackendOptions& options) {
    std::map<std::string, std::string> env = options.secrets;
    env["AGENT_RUN_ID"] = payload.run_id;
    env["AGENT_VARIATION_ID"] = std::to_string(payload.variation_id);
    env["AGENT_REPO_URL"] = payload.repo_url;
    env["AGENT_PAYLOAD_DIR"] = dir;
    env["AGENT_PROMPT_FILE"] = dir + "/prompt.txt";
    env["AGENT_CONFIG_FILE"] = dir + "/agent_config.json";
    env["PYTHONUNBUFFERED"] = "1";
    return env;
}

std::string sanitize_name(const std::string& name, size_t max_length) {
    std::string out;
    for (char c : to_lower(name)) {
        if ((c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')) {
            out += c;
        } else if (!out.empty() && out.back() != '-') {
            out += '-';
        }
        if (out.size() >= max_length) break;
    }
    while (!out.empty() && out.back() == '-') out.pop_back();
    return out;
}

} // namespace agentrun
