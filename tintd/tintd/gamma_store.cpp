// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#include <exception>
#include <spdlog/spdlog.h>

#include <tintd/gamma_store.hpp>

namespace tintd {

gamma_store::gamma_store(display_server &dsp)
: dsp_(&dsp) {
}

size_t gamma_store::capture_baseline() {
    const std::vector<display_id> ids = [&] {
        try {
            return dsp_->displays();
        } catch (const std::exception &e) {
            spdlog::error("[gamma_store] display enumeration failed: {}", e.what());
            return std::vector<display_id>();
        }
    }();

    size_t captured = 0;

    for (const display_id &id : ids) {
        if (baselines_.contains(id))
            continue;

        try {
            gamma_table table = dsp_->read_gamma(id);
            if (!table.valid()) {
                spdlog::warn("[gamma_store] [{}] invalid gamma table (size: {}), excluded", id, table.size());
                continue;
            }
            spdlog::info("[gamma_store] [{}] captured baseline ({} samples)", id, table.size());
            baselines_.emplace(id, std::move(table));
            ++captured;
        } catch (const std::exception &e) {
            spdlog::warn("[gamma_store] [{}] cannot read gamma, excluded: {}", id, e.what());
        }
    }

    return captured;
}

std::optional<gamma_table> gamma_store::baseline(const display_id &id) const {
    const auto it = baselines_.find(id);
    if (it == baselines_.end())
        return std::nullopt;
    return it->second;
}

bool gamma_store::has_baseline(const display_id &id) const {
    return baselines_.contains(id);
}

std::vector<display_id> gamma_store::displays() const {
    std::vector<display_id> ret;
    ret.reserve(baselines_.size());
    for (const auto &[id, table] : baselines_)
        ret.push_back(id);
    return ret;
}

bool gamma_store::restore_baseline(const display_id &id) {
    const auto it = baselines_.find(id);
    if (it == baselines_.end()) {
        spdlog::debug("[gamma_store] [{}] no baseline, nothing to restore", id);
        return false;
    }

    try {
        dsp_->write_gamma(id, it->second);
    } catch (const std::exception &e) {
        spdlog::warn("[gamma_store] [{}] restore failed: {}", id, e.what());
        return false;
    }

    return true;
}

}
