#include "cvpress/RendererRegistry.hpp"

#include "cvpress/Errors.hpp"

namespace cvpress {

RendererRegistry::Entry* RendererRegistry::find_locked(const std::string& format_name) {
    for (auto& e : entries_) {
        if (e.name == format_name) return &e;
    }
    return nullptr;
}

const RendererRegistry::Entry* RendererRegistry::find_locked(const std::string& format_name) const {
    for (const auto& e : entries_) {
        if (e.name == format_name) return &e;
    }
    return nullptr;
}

void RendererRegistry::register_renderer(const std::string& format_name, RendererFactory factory) {
    std::lock_guard<std::mutex> lock(mu_);

    if (Entry* e = find_locked(format_name)) {
        e->factory = std::move(factory);
        e->instance.reset();
        ++e->generation;
        return;
    }
    entries_.push_back(Entry{format_name, std::move(factory), nullptr, 0});
}

std::shared_ptr<Renderer> RendererRegistry::get(const std::string& format_name) {
    while (true) {
        RendererFactory factory;
        std::uint64_t generation = 0;
        {
            std::lock_guard<std::mutex> lock(mu_);
            const Entry* e = find_locked(format_name);
            if (!e || !e->factory) {
                std::vector<std::string> names;
                names.reserve(entries_.size());
                for (const auto& x : entries_) names.push_back(x.name);
                throw UnknownFormatError(format_name, names);
            }
            if (e->instance) return e->instance;
            factory = e->factory;
            generation = e->generation;
        }

        // built outside the lock: a factory may look up other formats
        std::shared_ptr<Renderer> built = factory();
        if (!built) throw Error("renderer factory for '" + format_name + "' returned null");

        std::lock_guard<std::mutex> lock(mu_);
        Entry* e = find_locked(format_name);
        // re-registered meanwhile: build again from the new factory
        if (!e || e->generation != generation) continue;
        // first published instance wins
        if (!e->instance) e->instance = std::move(built);
        return e->instance;
    }
}

bool RendererRegistry::contains(const std::string& format_name) const {
    std::lock_guard<std::mutex> lock(mu_);
    return find_locked(format_name) != nullptr;
}

std::vector<std::string> RendererRegistry::list() const {
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<std::string> names;
    names.reserve(entries_.size());
    for (const auto& e : entries_) names.push_back(e.name);
    return names;
}

}  // namespace cvpress
