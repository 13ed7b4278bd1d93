#include "cluster_job_backend.h"
#include "process_output_stream.h"
#include "errors.h"
#include "util.h"

#include <stdlib.h>
#include <unistd.h>

#include <iostream>
#include <sstream>

namespace agentrun {

namespace {

// Temp file removed when it goes out of scope
class ManifestFile {
public:
    explicit ManifestFile(const std::string& content) {
        char path[] = "/tmp/agentrun-job-XXXXXX";
        int fd = mkstemp(path);      // Created 0600
        if (fd < 0) {
            throw ProvisionError("cannot create manifest file", true);
        }
        path_ = path;

        size_t written = 0;
        while (written < content.size()) {
            ssize_t n = write(fd, content.data() + written, content.size() - written);
            if (n <= 0) {
                close(fd);
                unlink(path_.c_str());
                throw ProvisionError("cannot write manifest file", true);
            }
            written += n;
        }
        close(fd);
    }

    ~ManifestFile() { unlink(path_.c_str()); }

    ManifestFile(const ManifestFile&) = delete;
    ManifestFile& operator=(const ManifestFile&) = delete;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

std::string first_line(const std::string& text) {
    std::string line = trim(text.substr(0, text.find('\n')));
    return line.empty() ? "(no output)" : line;
}

Json::Value env_var(const std::string& name, const std::string& value) {
    Json::Value var;
    var["name"] = name;
    var["value"] = value;
    return var;
}

std::string format_cpu(double cores) {
    std::ostringstream out;
    out << cores;
    return out.str();
}

} // namespace

ClusterJobBackend::ClusterJobBackend(const ClusterJobSettings& settings,
                                     const BackendOptions& options)
    : settings_(settings), options_(options) {}

std::string ClusterJobBackend::job_name(const std::string& run_id, int variation_id) {
    std::string id = sanitize_name(run_id);
    if (id.size() > 16) {
        id = id.substr(id.size() - 16);
    }
    return sanitize_name("agentrun-" + id + "-" + std::to_string(variation_id));
}

bool ClusterJobBackend::is_transient_failure(const std::string& stderr_text) {
    static const char* patterns[] = {
        "connection refused",
        "unable to connect to the server",
        "i/o timeout",
        "tls handshake timeout",
        "serviceunavailable",
        "the server is currently unable to handle the request",
        "etcdserver: request timed out",
        "too many requests",
        "connection reset by peer"
    };
    std::string text = to_lower(stderr_text);
    for (const char* pattern : patterns) {
        if (text.find(pattern) != std::string::npos) return true;
    }
    return false;
}

BackendStatus ClusterJobBackend::status_from_job(const Json::Value& job) {
    const Json::Value& status = job["status"];
    for (const auto& condition : status["conditions"]) {
        if (condition["type"].asString() == "Failed" && condition["status"].asString() == "True") {
            return BackendStatus::FAILED;
        }
    }
    if (status.get("succeeded", 0).asInt() > 0) return BackendStatus::SUCCEEDED;
    if (status.get("failed", 0).asInt() > 0) return BackendStatus::FAILED;
    if (status.get("active", 0).asInt() > 0) return BackendStatus::ACTIVE;
    return BackendStatus::PENDING;
}

Json::Value ClusterJobBackend::build_manifest(const std::string& job_name,
                                              const SandboxPayload& payload,
                                              const ResourceLimits& limits) const {
    Json::Value labels;
    labels["app"] = "agentrun";
    labels["agentrun/run-id"] = sanitize_name(payload.run_id);
    labels["agentrun/variation"] = std::to_string(payload.variation_id);

    // Secret carrying the payload files and the injected secrets
    Json::Value secret;
    secret["apiVersion"] = "v1";
    secret["kind"] = "Secret";
    secret["metadata"]["name"] = job_name;
    secret["metadata"]["namespace"] = settings_.namespace_name;
    secret["metadata"]["labels"] = labels;
    secret["type"] = "Opaque";
    secret["stringData"]["prompt.txt"] = payload.prompt;
    secret["stringData"]["agent_config.json"] = to_json(
        payload.agent_config.isNull() ? Json::Value(Json::objectValue) : payload.agent_config);
    secret["stringData"]["repo_url.txt"] = payload.repo_url;
    for (const auto& [name, value] : options_.secrets) {
        secret["stringData"][name] = value;
    }

    Json::Value container;
    container["name"] = "agent";
    container["image"] = settings_.image;
    container["imagePullPolicy"] = "IfNotPresent";

    Json::Value env(Json::arrayValue);
    env.append(env_var("AGENT_RUN_ID", payload.run_id));
    env.append(env_var("AGENT_VARIATION_ID", std::to_string(payload.variation_id)));
    env.append(env_var("AGENT_REPO_URL", payload.repo_url));
    env.append(env_var("AGENT_PAYLOAD_DIR", "/payload"));
    env.append(env_var("AGENT_PROMPT_FILE", "/payload/prompt.txt"));
    env.append(env_var("AGENT_CONFIG_FILE", "/payload/agent_config.json"));
    env.append(env_var("AGENT_SETUP_TIMEOUT", std::to_string(limits.setup_timeout.count())));
    env.append(env_var("PYTHONUNBUFFERED", "1"));
    for (const auto& entry : options_.secrets) {
        Json::Value var;
        var["name"] = entry.first;
        var["valueFrom"]["secretKeyRef"]["name"] = job_name;
        var["valueFrom"]["secretKeyRef"]["key"] = entry.first;
        env.append(var);
    }
    container["env"] = env;

    std::string memory = std::to_string(limits.memory_mb) + "Mi";
    container["resources"]["limits"]["memory"] = memory;
    container["resources"]["limits"]["cpu"] = format_cpu(limits.cpu_cores);
    container["resources"]["requests"]["memory"] = memory;
    container["resources"]["requests"]["cpu"] = format_cpu(limits.cpu_cores);

    Json::Value mount;
    mount["name"] = "payload";
    mount["mountPath"] = "/payload";
    mount["readOnly"] = true;
    container["volumeMounts"].append(mount);

    Json::Value volume;
    volume["name"] = "payload";
    volume["secret"]["secretName"] = job_name;
    volume["secret"]["defaultMode"] = 0400;
    for (const char* key : {"prompt.txt", "agent_config.json", "repo_url.txt"}) {
        Json::Value item;
        item["key"] = key;
        item["path"] = key;
        volume["secret"]["items"].append(item);
    }

    Json::Value pod_spec;
    pod_spec["restartPolicy"] = "Never";
    if (!settings_.service_account.empty()) {
        pod_spec["serviceAccountName"] = settings_.service_account;
    }
    pod_spec["containers"].append(container);
    pod_spec["volumes"].append(volume);

    Json::Value job;
    job["apiVersion"] = "batch/v1";
    job["kind"] = "Job";
    job["metadata"]["name"] = job_name;
    job["metadata"]["namespace"] = settings_.namespace_name;
    job["metadata"]["labels"] = labels;
    job["spec"]["backoffLimit"] = 0;
    job["spec"]["ttlSecondsAfterFinished"] = settings_.job_ttl_seconds;
    job["spec"]["activeDeadlineSeconds"] = static_cast<Json::Int64>(limits.execution_timeout.count());
    job["spec"]["template"]["metadata"]["labels"] = labels;
    job["spec"]["template"]["spec"] = pod_spec;

    Json::Value list;
    list["apiVersion"] = "v1";
    list["kind"] = "List";
    list["items"].append(secret);
    list["items"].append(job);
    return list;
}

CommandResult ClusterJobBackend::kubectl(const std::vector<std::string>& args,
                                         std::chrono::seconds timeout) const {
    ProcessOptions options;
    options.argv = {settings_.kubectl};
    options.argv.insert(options.argv.end(), args.begin(), args.end());
    options.argv.push_back("--namespace");
    options.argv.push_back(settings_.namespace_name);
    options.merge_stderr = false;
    return Process::run(options, timeout);
}

SandboxHandle ClusterJobBackend::provision(const std::string& run_id,
                                           int variation_id,
                                           const std::string& repo_url,
                                           const std::string& prompt,
                                           const ResourceLimits& limits,
                                           const Json::Value& agent_config) {
    SandboxHandle handle;
    handle.id = job_name(run_id, variation_id);
    handle.run_id = run_id;
    handle.variation_id = variation_id;

    SandboxPayload payload{run_id, variation_id, repo_url, prompt, agent_config};
    ManifestFile manifest(to_json(build_manifest(handle.id, payload, limits)));

    // A failed or timed-out apply may still have created the objects
    CommandResult applied;
    try {
        applied = kubectl({"apply", "-f", manifest.path()}, options_.call_timeout);
    } catch (const TimeoutError& e) {
        discard(handle);
        throw ProvisionError(std::string("kubectl apply: ") + e.what(), true);
    } catch (const std::runtime_error& e) {
        discard(handle);
        throw ProvisionError(std::string("kubectl apply: ") + e.what());
    }
    if (applied.exit_code != 0) {
        discard(handle);
        throw ProvisionError("kubectl apply exited with code " + std::to_string(applied.exit_code) +
                                 ": " + first_line(applied.error_output),
                             is_transient_failure(applied.error_output));
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        deadlines_[handle.id] = std::chrono::steady_clock::now() + limits.setup_timeout +
                                limits.execution_timeout;
    }
    std::cout << "[ClusterJob] Created job " << handle.id << " in "
              << settings_.namespace_name << std::endl;

    // Pod scheduling and image pull count against the setup timeout
    std::string wait_timeout = std::to_string(limits.setup_timeout.count()) + "s";
    CommandResult ready;
    try {
        ready = kubectl({"wait", "--for=condition=Ready", "pod",
                         "--selector=job-name=" + handle.id, "--timeout=" + wait_timeout},
                        limits.setup_timeout + options_.call_timeout);
    } catch (const std::runtime_error& e) {
        discard(handle);
        throw ProvisionError(std::string("pod wait: ") + e.what());
    }

    if (ready.exit_code != 0) {
        if (to_lower(ready.error_output).find("timed out") != std::string::npos) {
            discard(handle);
            throw ProvisionError("pod for " + handle.id + " not ready within " + wait_timeout);
        }
        // A pod that already finished is never Ready; logs still work
        std::cerr << "[ClusterJob] Warning: wait for " << handle.id << ": "
                  << first_line(ready.error_output) << std::endl;
    }
    return handle;
}

std::unique_ptr<OutputStream> ClusterJobBackend::stream_output(const SandboxHandle& handle) {
    ProcessOptions options;
    options.argv = {settings_.kubectl, "logs", "--follow", "job/" + handle.id,
                    "--namespace", settings_.namespace_name,
                    "--pod-running-timeout=" + std::to_string(options_.call_timeout.count()) + "s"};

    std::shared_ptr<Process> process;
    try {
        process = std::make_shared<Process>(options);
    } catch (const std::runtime_error& e) {
        throw ExecutionError(std::string("kubectl logs: ") + e.what());
    }

    ProcessOutputStream::Options stream_options;
    stream_options.label = "Job " + handle.id + " log stream";
    stream_options.error_prefix = options_.error_prefix;
    stream_options.terminate_grace = options_.terminate_grace;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = deadlines_.find(handle.id);
        stream_options.deadline = it != deadlines_.end()
            ? it->second
            : std::chrono::steady_clock::now() + std::chrono::seconds(DEFAULT_EXECUTION_TIMEOUT_SECONDS);
    }
    return std::make_unique<ProcessOutputStream>(process, stream_options);
}

BackendStatus ClusterJobBackend::status(const SandboxHandle& handle) {
    CommandResult result = kubectl({"get", "job", handle.id, "-o", "json"}, options_.call_timeout);
    if (result.exit_code != 0) {
        if (result.error_output.find("NotFound") != std::string::npos) {
            return BackendStatus::FAILED;
        }
        throw ExecutionError("kubectl get job exited with code " +
                             std::to_string(result.exit_code) + ": " +
                             first_line(result.error_output));
    }

    Json::Value job;
    if (!parse_json(result.output, job)) {
        throw ExecutionError("kubectl get job returned malformed JSON");
    }
    return status_from_job(job);
}

void ClusterJobBackend::terminate(const SandboxHandle& handle) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        deadlines_.erase(handle.id);
    }

    CommandResult result = kubectl({"delete", "job/" + handle.id, "secret/" + handle.id,
                                    "--ignore-not-found", "--wait=false",
                                    "--cascade=background"},
                                   options_.call_timeout);
    if (result.exit_code != 0) {
        throw ExecutionError("kubectl delete exited with code " +
                             std::to_string(result.exit_code) + ": " +
                             first_line(result.error_output));
    }
    std::cout << "[ClusterJob] Deleted job " << handle.id << std::endl;
}

Json::Value ClusterJobBackend::describe() const {
    Json::Value json;
    json["namespace"] = settings_.namespace_name;
    json["image"] = settings_.image;
    std::lock_guard<std::mutex> lock(mutex_);
    json["tracked_jobs"] = static_cast<Json::UInt64>(deadlines_.size());
    return json;
}

void ClusterJobBackend::discard(const SandboxHandle& handle) {
    try {
        terminate(handle);
    } catch (const std::runtime_error& e) {
        std::cerr << "[ClusterJob] Warning: cleanup of " << handle.id << " failed: "
                  << e.what() << std::endl;
    }
}

} // namespace agentrun
