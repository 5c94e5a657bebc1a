#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "cvpress/Renderer.hpp"

namespace cvpress {

using RendererFactory = std::function<std::shared_ptr<Renderer>()>;

// Format name -> renderer factory. Instances are built on first get() and
// cached until the name is registered again. Safe for concurrent use.
// Factories run without the lock held and may call get() themselves; when
// two callers race, both build and the first instance stored is shared.
class RendererRegistry {
public:
    // Last writer wins. Callers holding the previous instance keep it alive.
    void register_renderer(const std::string& format_name, RendererFactory factory);

    // Throws UnknownFormatError for names that were never registered.
    std::shared_ptr<Renderer> get(const std::string& format_name);

    bool contains(const std::string& format_name) const;

    // Registration order.
    std::vector<std::string> list() const;

private:
    struct Entry {
        std::string name;
        RendererFactory factory;
        std::shared_ptr<Renderer> instance;
        std::uint64_t generation;
    };

    mutable std::mutex mu_;
    std::vector<Entry> entries_;

    Entry* find_locked(const std::string& format_name);
    const Entry* find_locked(const std::string& format_name) const;
};

}  // namespace cvpress
