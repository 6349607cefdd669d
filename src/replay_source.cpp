#include "replay_source.hpp"
#include <iostream>
#include <stdexcept>
#include <vector>
#include <boost/algorithm/string.hpp> // For boost::split, boost::trim, boost::iequals

ReplaySource::ReplaySource(const std::string& path, bool verbose, size_t batches_per_poll)
    : path(path), in(path), verbose(verbose), batches_per_poll(batches_per_poll) {
    if (batches_per_poll == 0) {
        throw std::invalid_argument("ReplaySource: batches_per_poll must be at least 1.");
    }
    if (!in.is_open()) {
        throw std::runtime_error("Error opening scan log for replay: " + path);
    }
    std::string header;
    if (!std::getline(in, header)) {
        throw std::runtime_error("Scan log is empty: " + path);
    }
    ++line_no;
    std::vector<std::string> fields;
    boost::trim(header);
    boost::split(fields, header, boost::is_any_of(","));
    if (fields.size() < 3 || !boost::iequals(boost::trim_copy(fields[0]), "ts") ||
        !boost::iequals(boost::trim_copy(fields[1]), "freq") || !boost::iequals(boost::trim_copy(fields[2]), "db")) {
        throw std::runtime_error("Scan log " + path + " must start with a 'ts,freq,db' header.");
    }
}

bool ReplaySource::read_row(double& ts, ScanSample& sample) {
    std::string line;
    while (std::getline(in, line)) {
        ++line_no;
        boost::trim(line);
        if (line.empty()) continue;

        std::vector<std::string> fields;
        boost::split(fields, line, boost::is_any_of(","));
        if (fields.size() != 3) {
            std::cerr << "Warning: " << path << ":" << line_no << ": expected 3 fields, skipping row." << std::endl;
            ++skipped;
            continue;
        }
        try {
            ts = std::stod(fields[0]);
            sample.frequency_mhz = std::stod(fields[1]);
            sample.power_db = std::stod(fields[2]);
        } catch (const std::logic_error&) {
            std::cerr << "Warning: " << path << ":" << line_no << ": unparsable value, skipping row." << std::endl;
            ++skipped;
            continue;
        }
        return true;
    }
    return false;
}

std::optional<ScanBatch> ReplaySource::poll_batch() {
    if (stopped) return std::nullopt;
    if (released_this_poll >= batches_per_poll) {
        released_this_poll = 0;
        return std::nullopt;
    }
    if (!have_lookahead) {
        if (exhausted || !read_row(lookahead_ts, lookahead_sample)) {
            exhausted = true;
            return std::nullopt;
        }
        have_lookahead = true;
    }

    ScanBatch batch;
    batch.timestamp = lookahead_ts;
    batch.scan_config = {{"source", "replay"}, {"path", path}};
    batch.samples.push_back(lookahead_sample);
    have_lookahead = false;

    double ts = 0.0;
    ScanSample sample{0.0, 0.0};
    while (read_row(ts, sample)) {
        if (ts != batch.timestamp) {
            lookahead_ts = ts;
            lookahead_sample = sample;
            have_lookahead = true;
            break;
        }
        batch.samples.push_back(sample);
    }
    if (!have_lookahead) exhausted = true;

    ++batch_count;
    ++released_this_poll;
    if (verbose) {
        std::cout << "Replay: batch " << batch_count << " with " << batch.samples.size() << " samples." << std::endl;
    }
    return batch;
}

bool ReplaySource::is_healthy() const {
    return !stopped && !(exhausted && !have_lookahead);
}

void ReplaySource::shutdown() {
    if (stopped) return;
    stopped = true;
    in.close();
    std::cout << "Replay: stopped after " << batch_count << " batches (" << skipped << " rows skipped)." << std::endl;
}
