#pragma once

#include <boost/filesystem.hpp>

// floor(now / rotate_secs) * rotate_secs
long rotation_bucket(double now, long rotate_secs);

/**
 * Chooses the output directory for persisted artifacts.
 *
 * With rotation enabled the directory is `<save_root>/<bucket>`, created on first use.
 * The active bucket never moves backwards, even if the wall clock does. With
 * `rotate_secs == 0` everything goes straight into `save_root`.
 */
class RotationManager {
public:
    RotationManager(const boost::filesystem::path& save_root, long rotate_secs);

    const boost::filesystem::path& select(double now);

    long current_bucket() const { return bucket; }
    const boost::filesystem::path& current_dir() const { return active_dir; }
    bool rotating() const { return period > 0; }

private:
    boost::filesystem::path root;
    long period;
    long bucket = -1;
    boost::filesystem::path active_dir;
};
