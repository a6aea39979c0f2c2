#include <livepatch/vdom/diff.h>
#include <livepatch/core/config.h>
#include <livepatch/core/diagnostics.h>

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

namespace livepatch::vdom {

namespace config = core::config;

namespace {

constexpr std::size_t kNone = static_cast<std::size_t>(-1);

Path child_path(const Path& parent, std::size_t index) {
    Path p = parent;
    p.push_back(index);
    return p;
}

std::string describe(const Node& node) {
    std::string out = "<" + node.tag();
    if (node.identity()) out += "#" + *node.identity();
    out += ">";
    return out;
}

bool children_structurally_equal(const std::vector<Node>& a, const std::vector<Node>& b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (!structurally_equal(a[i], b[i])) return false;
    }
    return true;
}

// Prefix-maximum Fenwick tree over old child indices, used for the
// heaviest increasing run of surviving children.
class MaxFenwick {
public:
    explicit MaxFenwick(std::size_t size) : tree_(size + 1, {0, kNone}) {}

    void update(std::size_t index, std::pair<std::size_t, std::size_t> value) {
        for (std::size_t i = index + 1; i < tree_.size(); i += i & (~i + 1)) {
            if (value.first > tree_[i].first) tree_[i] = value;
        }
    }

    // Best entry among indices [0, count).
    std::pair<std::size_t, std::size_t> query(std::size_t count) const {
        std::pair<std::size_t, std::size_t> best{0, kNone};
        for (std::size_t i = count; i > 0; i -= i & (~i + 1)) {
            if (tree_[i].first > best.first) best = tree_[i];
        }
        return best;
    }

private:
    std::vector<std::pair<std::size_t, std::size_t>> tree_;
};

class Differ {
public:
    explicit Differ(const DiffOptions& options) : options_(options) {}

    void diff_node(const Node& old_node, const Node& new_node, const Path& path);

    std::vector<Patch> take() { return std::move(patches_); }

private:
    const DiffOptions& options_;
    std::vector<Patch> patches_;

    void emit(const Path& path, const std::optional<std::string>& target, Operation op) {
        patches_.push_back(Patch{path, target, std::move(op)});
    }

    void diff_attributes(const Node& old_node, const Node& new_node, const Path& path);
    void diff_children(const Node& old_node, const Node& new_node, const Path& path);
    void diff_replace_all(const Node& old_node, const Node& new_node, const Path& path);
    void diff_indexed(const Node& old_node, const Node& new_node, const Path& path);
    void diff_keyed(const Node& old_node, const Node& new_node, const Path& path);

    std::vector<std::optional<std::string>> effective_keys(const Node& parent);
};

void Differ::diff_node(const Node& old_node, const Node& new_node, const Path& path) {
    if (old_node.is_text() != new_node.is_text() || old_node.tag() != new_node.tag()) {
        emit(path, old_node.identity(), op::Replace{new_node});
        return;
    }

    if (old_node.is_text()) {
        if (old_node.text_content() != new_node.text_content()) {
            emit(path, std::nullopt, op::SetText{new_node.text_content()});
        }
        return;
    }

    diff_attributes(old_node, new_node, path);
    diff_children(old_node, new_node, path);
}

void Differ::diff_attributes(const Node& old_node, const Node& new_node, const Path& path) {
    const auto& old_attrs = old_node.attributes();
    const auto& new_attrs = new_node.attributes();

    for (const auto& [name, value] : old_attrs) {
        if (name == config::kIdentityAttribute) continue;
        if (new_attrs.find(name) == new_attrs.end()) {
            emit(path, old_node.identity(), op::RemoveAttr{name});
        }
    }

    for (const auto& [name, value] : new_attrs) {
        if (name == config::kIdentityAttribute) continue;
        auto it = old_attrs.find(name);
        if (it == old_attrs.end() || it->second != value) {
            emit(path, old_node.identity(), op::SetAttr{name, value});
        }
    }
}

void Differ::diff_children(const Node& old_node, const Node& new_node, const Path& path) {
    if (old_node.has_attribute(config::kReplaceAllAttribute) ||
        new_node.has_attribute(config::kReplaceAllAttribute)) {
        diff_replace_all(old_node, new_node, path);
        return;
    }

    const auto& new_children = new_node.children();
    const bool keyed = std::any_of(new_children.begin(), new_children.end(),
                                   [](const Node& child) { return child.key().has_value(); });
    if (keyed) {
        diff_keyed(old_node, new_node, path);
    } else {
        diff_indexed(old_node, new_node, path);
    }
}

void Differ::diff_replace_all(const Node& old_node, const Node& new_node, const Path& path) {
    const auto& old_children = old_node.children();
    const auto& new_children = new_node.children();
    if (children_structurally_equal(old_children, new_children)) return;

    for (std::size_t i = old_children.size(); i-- > 0;) {
        emit(path, old_node.identity(), op::RemoveChild{i});
    }
    for (std::size_t j = 0; j < new_children.size(); ++j) {
        emit(path, old_node.identity(), op::InsertChild{j, new_children[j]});
    }
}

void Differ::diff_indexed(const Node& old_node, const Node& new_node, const Path& path) {
    const auto& old_children = old_node.children();
    const auto& new_children = new_node.children();
    const std::size_t common = std::min(old_children.size(), new_children.size());

    for (std::size_t i = 0; i < common; ++i) {
        diff_node(old_children[i], new_children[i], child_path(path, i));
    }
    for (std::size_t i = old_children.size(); i-- > common;) {
        emit(path, old_node.identity(), op::RemoveChild{i});
    }
    for (std::size_t j = common; j < new_children.size(); ++j) {
        emit(path, old_node.identity(), op::InsertChild{j, new_children[j]});
    }
}

std::vector<std::optional<std::string>> Differ::effective_keys(const Node& parent) {
    const auto& children = parent.children();
    std::vector<std::optional<std::string>> keys(children.size());
    std::unordered_map<std::string, std::size_t> seen;
    for (std::size_t i = 0; i < children.size(); ++i) {
        const auto& key = children[i].key();
        if (!key) continue;
        auto [it, inserted] = seen.emplace(*key, i);
        if (!inserted) {
            if (options_.diagnostics) {
                options_.diagnostics->warning(
                    "diff", "keyed",
                    "duplicate key '" + *key + "' at child " + std::to_string(i) + " of " +
                        describe(parent) + " (first at " + std::to_string(it->second) +
                        "); treated as unkeyed");
            }
            continue;
        }
        keys[i] = key;
    }
    return keys;
}

void Differ::diff_keyed(const Node& old_node, const Node& new_node, const Path& path) {
    const auto& old_children = old_node.children();
    const auto& new_children = new_node.children();
    const std::size_t n_old = old_children.size();
    const std::size_t n_new = new_children.size();

    const auto old_keys = effective_keys(old_node);
    const auto new_keys = effective_keys(new_node);

    std::unordered_map<std::string, std::size_t> old_by_key;
    for (std::size_t i = 0; i < n_old; ++i) {
        if (old_keys[i]) old_by_key.emplace(*old_keys[i], i);
    }

    // match[j]: old index paired with new child j
    std::vector<std::size_t> match(n_new, kNone);
    std::vector<bool> old_matched(n_old, false);

    for (std::size_t j = 0; j < n_new; ++j) {
        if (!new_keys[j]) continue;
        auto it = old_by_key.find(*new_keys[j]);
        if (it != old_by_key.end()) {
            match[j] = it->second;
            old_matched[it->second] = true;
        }
    }
    for (std::size_t j = 0; j < n_new; ++j) {
        if (new_keys[j]) continue;
        if (j < n_old && !old_keys[j] && !old_matched[j]) {
            match[j] = j;
            old_matched[j] = true;
        }
    }

    // Survivors in new order. A survivor without identity cannot be located
    // by the client once siblings shift, so it must stay in place; pinned
    // pairs that would have to cross each other are re-created instead.
    struct Survivor {
        std::size_t new_index;
        std::size_t old_index;
        bool pinned;
    };
    std::vector<Survivor> survivors;
    std::size_t last_pinned = kNone;
    for (std::size_t j = 0; j < n_new; ++j) {
        if (match[j] == kNone) continue;
        const std::size_t i = match[j];
        const bool pinned = !old_children[i].identity().has_value();
        if (pinned) {
            if (last_pinned != kNone && i < last_pinned) {
                if (options_.diagnostics) {
                    options_.diagnostics->info(
                        "diff", "keyed",
                        "child " + std::to_string(i) + " of " + describe(old_node) +
                            " has no identity and cannot move; re-created");
                }
                match[j] = kNone;
                old_matched[i] = false;
                continue;
            }
            last_pinned = i;
        }
        survivors.push_back({j, i, pinned});
    }

    for (std::size_t i = n_old; i-- > 0;) {
        if (!old_matched[i]) {
            emit(path, old_node.identity(), op::RemoveChild{i});
        }
    }

    // Heaviest run of survivors whose old order already agrees with the new
    // order. Pinned survivors outweigh every movable one combined, so all of
    // them land in the run.
    const std::size_t count = survivors.size();
    const std::size_t pinned_weight = count + 1;
    std::vector<std::size_t> previous(count, kNone);
    std::vector<std::size_t> score(count, 0);
    MaxFenwick best_before(n_old);
    std::size_t best_end = kNone;
    for (std::size_t t = 0; t < count; ++t) {
        const auto best = best_before.query(survivors[t].old_index);
        score[t] = best.first + (survivors[t].pinned ? pinned_weight : 1);
        previous[t] = best.second;
        best_before.update(survivors[t].old_index, {score[t], t});
        if (best_end == kNone || score[t] > score[best_end]) best_end = t;
    }
    std::vector<bool> stable(count, false);
    for (std::size_t t = best_end; t != kNone; t = previous[t]) {
        stable[t] = true;
    }

    // Replay the moves against the post-removal sibling order, placing each
    // mover right after its predecessor in the new order.
    std::vector<std::size_t> order(count);
    for (std::size_t t = 0; t < count; ++t) order[t] = t;
    std::sort(order.begin(), order.end(), [&survivors](std::size_t a, std::size_t b) {
        return survivors[a].old_index < survivors[b].old_index;
    });
    for (std::size_t t = 0; t < count; ++t) {
        if (stable[t]) continue;
        auto current = std::find(order.begin(), order.end(), t);
        order.erase(current);
        std::size_t to = 0;
        if (t > 0) {
            auto predecessor = std::find(order.begin(), order.end(), t - 1);
            to = static_cast<std::size_t>(predecessor - order.begin()) + 1;
        }
        order.insert(order.begin() + static_cast<std::ptrdiff_t>(to), t);
        emit(path, old_node.identity(), op::MoveChild{survivors[t].old_index, to});
    }

    for (std::size_t j = 0; j < n_new; ++j) {
        if (match[j] == kNone) {
            emit(path, old_node.identity(), op::InsertChild{j, new_children[j]});
        }
    }

    for (const auto& s : survivors) {
        diff_node(old_children[s.old_index], new_children[s.new_index],
                  child_path(path, s.new_index));
    }
}

} // namespace

std::vector<Patch> diff(const Node& old_node, const Node& new_node) {
    return diff(old_node, new_node, Path{}, DiffOptions{});
}

std::vector<Patch> diff(const Node& old_node, const Node& new_node, const Path& path) {
    return diff(old_node, new_node, path, DiffOptions{});
}

std::vector<Patch> diff(const Node& old_node, const Node& new_node, const Path& path,
                        const DiffOptions& options) {
    Differ differ(options);
    differ.diff_node(old_node, new_node, path);
    return differ.take();
}

} // namespace livepatch::vdom
