#pragma once

#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace agentrun {

// Base image configuration
struct ImageSpec {
    std::string name;                      // e.g. "agent-base"
    std::string setup_script;              // Optional, run once inside the base dir
    int max_age_hours = 24;                // Rebuilt after this age
};

// Built base image
struct CachedImage {
    std::string name;
    std::string base_path;
    std::chrono::steady_clock::time_point created_at;
    std::chrono::steady_clock::time_point last_used;
    size_t use_count = 0;
    bool ready = false;
};

// Builds each base image once per process and hands every variation its
// own copy of it as a workspace.
class ImageCache {
public:
    explicit ImageCache(std::string cache_dir);

    void register_image(const ImageSpec& spec);
    bool has_image(const std::string& name) const;

    // Builds the base image on first use, then copies it to a fresh
    // workspace directory. Throws ProvisionError.
    std::string prepare_workspace(const std::string& image_name,
                                  const std::string& workspace_id,
                                  std::chrono::seconds setup_timeout);

    void release_workspace(const std::string& path);

    // Evicts images past max age and workspaces older than the given age
    void sweep(std::chrono::hours workspace_max_age);

    struct Stats {
        int registered_images;
        int cached_images;
        int total_uses;
        int live_workspaces;
    };
    Stats get_stats() const;

    const std::string& cache_dir() const { return cache_dir_; }

private:
    std::string build_base_image(const ImageSpec& spec, std::chrono::seconds setup_timeout);

    mutable std::mutex mutex_;
    std::string cache_dir_;
    std::map<std::string, ImageSpec> images_;
    std::map<std::string, CachedImage> cached_;
    size_t live_workspaces_ = 0;
};

} // namespace agentrun
