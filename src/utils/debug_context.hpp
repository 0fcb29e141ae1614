#pragma once

#include <algorithm>
#include <cstddef>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace debug {

// One step of the rewrite pipeline, e.g. {"rewrite", "logical-and"} or
// {"merge", "subpattern"}.
struct ContextEntry {
    std::string stage;
    std::string detail;
};

class Context {
public:
    // Restores the trail to the depth it had before the entry was pushed.
    class Guard {
    public:
        Guard(Guard&& other) noexcept
            : owner_(std::exchange(other.owner_, nullptr)), mark_(other.mark_) {}

        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;
        Guard& operator=(Guard&&) = delete;

        ~Guard() {
            if (owner_) {
                owner_->truncate(mark_);
            }
        }

    private:
        friend class Context;

        Guard(Context& owner, std::size_t mark) : owner_(&owner), mark_(mark) {}

        Context* owner_;
        std::size_t mark_;
    };

    static Context& instance() {
        static Context ctx;
        return ctx;
    }

    Guard push(std::string stage, std::string detail) {
        std::size_t mark = entries_.size();
        entries_.push_back(ContextEntry{std::move(stage), std::move(detail)});
        return Guard(*this, mark);
    }

    std::size_t depth() const { return entries_.size(); }

    bool in_stage(std::string_view stage) const {
        return std::any_of(entries_.begin(), entries_.end(),
                           [&](const ContextEntry& entry) { return entry.stage == stage; });
    }

    std::string format(const std::string& message) const {
        if (entries_.empty()) {
            return message;
        }
        std::ostringstream out;
        const char* sep = "In ";
        for (const auto& entry : entries_) {
            out << sep << entry.stage;
            if (!entry.detail.empty()) {
                out << " '" << entry.detail << "'";
            }
            sep = " -> ";
        }
        out << ": " << message;
        return out.str();
    }

private:
    void truncate(std::size_t mark) {
        if (mark < entries_.size()) {
            entries_.resize(mark);
        }
    }

    inline static thread_local std::vector<ContextEntry> entries_{};
};

inline Context::Guard push(std::string stage, std::string detail) {
    return Context::instance().push(std::move(stage), std::move(detail));
}

inline std::string format_with_context(const std::string& message) {
    return Context::instance().format(message);
}

} // namespace debug
