#include "rotation_manager.hpp"
#include "atomic_file.hpp"
#include <cmath>
#include <stdexcept>

long rotation_bucket(double now, long rotate_secs) {
    if (rotate_secs <= 0) throw std::invalid_argument("rotation_bucket: rotate_secs must be positive.");
    return static_cast<long>(std::floor(now / static_cast<double>(rotate_secs))) * rotate_secs;
}

RotationManager::RotationManager(const boost::filesystem::path& save_root, long rotate_secs)
    : root(save_root), period(rotate_secs), active_dir(save_root) {
    if (period < 0) throw std::invalid_argument("RotationManager: rotate_secs cannot be negative.");
}

const boost::filesystem::path& RotationManager::select(double now) {
    if (period == 0) {
        ensure_directory(root);
        return active_dir;
    }
    long next = rotation_bucket(now, period);
    if (next > bucket) {
        bucket = next;
        active_dir = root / std::to_string(bucket);
    }
    ensure_directory(active_dir);
    return active_dir;
}
