#include "image_cache.h"
#include "errors.h"
#include "process.h"

#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace agentrun {

ImageCache::ImageCache(std::string cache_dir) : cache_dir_(std::move(cache_dir)) {
    fs::create_directories(cache_dir_);
}

void ImageCache::register_image(const ImageSpec& spec) {
    std::lock_guard<std::mutex> lock(mutex_);
    images_[spec.name] = spec;
    std::cout << "[ImageCache] Registered image: " << spec.name << std::endl;
}

bool ImageCache::has_image(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return images_.count(name) > 0;
}

std::string ImageCache::prepare_workspace(const std::string& image_name,
                                          const std::string& workspace_id,
                                          std::chrono::seconds setup_timeout) {
    std::string base_path;
    {
        // Held across the build so concurrent variations wait for one build
        std::lock_guard<std::mutex> lock(mutex_);

        auto spec_it = images_.find(image_name);
        if (spec_it == images_.end()) {
            throw ProvisionError("image not registered: " + image_name);
        }

        auto cache_it = cached_.find(image_name);
        if (cache_it != cached_.end() && cache_it->second.ready) {
            base_path = cache_it->second.base_path;
            cache_it->second.last_used = std::chrono::steady_clock::now();
            cache_it->second.use_count++;
        } else {
            std::cout << "[ImageCache] Building image: " << image_name << std::endl;
            base_path = build_base_image(spec_it->second, setup_timeout);

            CachedImage cached;
            cached.name = image_name;
            cached.base_path = base_path;
            cached.created_at = std::chrono::steady_clock::now();
            cached.last_used = cached.created_at;
            cached.use_count = 1;
            cached.ready = true;
            cached_[image_name] = cached;
        }
        live_workspaces_++;
    }

    std::string workspace = cache_dir_ + "/ws_" + workspace_id;
    std::error_code ec;
    fs::remove_all(workspace, ec);
    fs::create_directories(workspace, ec);
    if (!ec) {
        fs::copy(base_path, workspace,
                 fs::copy_options::recursive | fs::copy_options::copy_symlinks, ec);
    }
    if (ec) {
        release_workspace(workspace);
        throw ProvisionError("cannot create workspace " + workspace + ": " + ec.message());
    }
    return workspace;
}

void ImageCache::release_workspace(const std::string& path) {
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) {
        std::cerr << "[ImageCache] Failed to remove " << path << ": " << ec.message() << std::endl;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (live_workspaces_ > 0) live_workspaces_--;
}

std::string ImageCache::build_base_image(const ImageSpec& spec, std::chrono::seconds setup_timeout) {
    std::string base_path = cache_dir_ + "/base_" + spec.name;
    std::error_code ec;
    fs::remove_all(base_path, ec);
    fs::create_directories(base_path, ec);
    if (ec) {
        throw ProvisionError("cannot create image dir " + base_path + ": " + ec.message());
    }

    if (!spec.setup_script.empty()) {
        if (!fs::exists(spec.setup_script)) {
            throw ProvisionError("image setup script not found: " + spec.setup_script);
        }

        ProcessOptions options;
        options.argv = {"/bin/sh", fs::absolute(spec.setup_script).string()};
        options.working_dir = base_path;
        options.env["AGENT_IMAGE_DIR"] = base_path;

        CommandResult result;
        try {
            result = Process::run(options, setup_timeout);
        } catch (const std::runtime_error& e) {
            throw ProvisionError("image " + spec.name + " setup: " + e.what());
        }
        if (result.exit_code != 0) {
            std::cerr << "[ImageCache] Setup output for " << spec.name << ":\n"
                      << result.output << std::endl;
            throw ProvisionError("image " + spec.name + " setup exited with code " +
                                 std::to_string(result.exit_code));
        }
    }

    std::cout << "[ImageCache] Image built: " << spec.name << " at " << base_path << std::endl;
    return base_path;
}

void ImageCache::sweep(std::chrono::hours workspace_max_age) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto now = std::chrono::steady_clock::now();
    for (auto it = cached_.begin(); it != cached_.end();) {
        const auto& spec = images_[it->second.name];
        auto age = std::chrono::duration_cast<std::chrono::hours>(now - it->second.created_at);
        if (age.count() >= spec.max_age_hours) {
            std::cout << "[ImageCache] Evicting image " << it->first
                      << " (age: " << age.count() << "h)" << std::endl;
            std::error_code ec;
            fs::remove_all(it->second.base_path, ec);
            it = cached_.erase(it);
        } else {
            ++it;
        }
    }

    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(cache_dir_, ec)) {
        if (entry.path().filename().string().rfind("ws_", 0) != 0) continue;

        auto modified = fs::last_write_time(entry, ec);
        if (ec) continue;
        auto age = fs::file_time_type::clock::now() - modified;
        if (age >= workspace_max_age) {
            std::cout << "[ImageCache] Removing stale workspace "
                      << entry.path().filename() << std::endl;
            fs::remove_all(entry.path(), ec);
        }
    }
}

ImageCache::Stats ImageCache::get_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    Stats stats;
    stats.registered_images = static_cast<int>(images_.size());
    stats.cached_images = static_cast<int>(cached_.size());
    stats.total_uses = 0;
    stats.live_workspaces = static_cast<int>(live_workspaces_);
    for (const auto& [name, cached] : cached_) {
        stats.total_uses += static_cast<int>(cached.use_count);
    }
    return stats;
}

} // namespace agentrun
