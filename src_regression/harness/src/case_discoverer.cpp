#include "calregress/case_discoverer.hpp"

#include <algorithm>
#include <optional>
#include <string>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace {

void require_directory(const fs::path& root) {
    std::error_code ec;
    if (!fs::exists(root, ec)) {
        throw calregress::DiscoveryError("Test data root does not exist: " + root.string());
    }
    if (!fs::is_directory(root, ec)) {
        throw calregress::DiscoveryError("Test data root is not a directory: " + root.string());
    }
}

struct Frame {
    std::vector<fs::path> entries;
    std::size_t next{0};
    std::size_t depth{0};
};

}  // namespace

namespace calregress {

class CaseDiscoverer::Iterator::Impl {
public:
    Impl(const CaseDiscoverer& owner) : owner_{owner} {
        stack_.push_back(Frame{list(owner_.root_), 0, 0});
        advance();
    }

    [[nodiscard]] bool at_end() const noexcept { return !current_.has_value(); }
    [[nodiscard]] const TestCase& current() const { return *current_; }

    void advance() {
        current_.reset();
        while (!stack_.empty()) {
            auto& top = stack_.back();
            if (top.next >= top.entries.size()) {
                stack_.pop_back();
                continue;
            }
            const auto path = top.entries[top.next++];
            const auto depth = top.depth;

            std::error_code ec;
            const auto link_status = fs::symlink_status(path, ec);
            if (ec) {
                owner_.log_.warn("Skipping " + path.string() + ": " + ec.message());
                continue;
            }
            if (fs::is_directory(link_status)) {
                if (depth + 1 <= owner_.options_.max_depth) {
                    auto entries = list(path);
                    stack_.push_back(Frame{std::move(entries), 0, depth + 1});
                }
                continue;
            }
            if (!fs::is_regular_file(path, ec) || !owner_.options_.is_primary(path)) {
                continue;
            }
            if (auto test = make_case(path)) {
                current_ = std::move(test);
                return;
            }
        }
    }

private:
    std::vector<fs::path> list(const fs::path& directory) const {
        std::vector<fs::path> entries;
        std::error_code ec;
        fs::directory_iterator it(directory, fs::directory_options::skip_permission_denied, ec);
        for (; !ec && it != fs::directory_iterator{}; it.increment(ec)) {
            entries.push_back(it->path());
        }
        if (ec) {
            owner_.log_.warn("Skipping unreadable directory " + directory.string() + ": " + ec.message());
            return {};
        }
        std::sort(entries.begin(), entries.end());
        return entries;
    }

    std::optional<TestCase> make_case(const fs::path& input) {
        const auto& options = owner_.options_;
        const ArtifactSource& source = options.source ? *options.source : owner_.file_source_;

        FieldMap header;
        try {
            header = source.primary_header(input);
        } catch (const UnreadableArtifact& ex) {
            owner_.log_.warn("Skipping unreadable input: " + std::string{ex.what()});
            return std::nullopt;
        }

        if (!options.selector.matches(header)) {
            return std::nullopt;
        }

        std::error_code ec;
        auto absolute = fs::absolute(input, ec);
        if (ec) {
            absolute = input;
        }
        auto command = options.commands.resolve(header, absolute);
        if (!command) {
            owner_.log_.warn("No executable mapped for " + input.string() + " (" +
                             options.commands.keyword + "), skipping");
            return std::nullopt;
        }

        TestCase test;
        test.id = input.lexically_relative(owner_.root_).generic_string();
        test.index = next_index_++;
        test.input_directory = absolute.parent_path();
        test.primary_input = absolute;
        test.command = std::move(*command);

        const auto tag = [&](const std::string& key) {
            if (auto it = header.find(key); it != header.end()) {
                test.tags[key] = it->second;
            }
        };
        tag(options.commands.keyword);
        for (const auto& clause : options.selector.clauses()) {
            tag(clause.keyword);
        }
        return test;
    }

    const CaseDiscoverer& owner_;
    std::vector<Frame> stack_;
    std::optional<TestCase> current_;
    std::size_t next_index_{0};
};

CaseDiscoverer::Iterator::Iterator(std::unique_ptr<Impl> impl) : impl_{std::move(impl)} {}
CaseDiscoverer::Iterator::~Iterator() = default;
CaseDiscoverer::Iterator::Iterator(Iterator&&) noexcept = default;
CaseDiscoverer::Iterator& CaseDiscoverer::Iterator::operator=(Iterator&&) noexcept = default;

CaseDiscoverer::Iterator::reference CaseDiscoverer::Iterator::operator*() const {
    return impl_->current();
}

CaseDiscoverer::Iterator::pointer CaseDiscoverer::Iterator::operator->() const {
    return &impl_->current();
}

CaseDiscoverer::Iterator& CaseDiscoverer::Iterator::operator++() {
    impl_->advance();
    return *this;
}

bool CaseDiscoverer::Iterator::operator==(const Iterator& other) const {
    const bool this_end = !impl_ || impl_->at_end();
    const bool other_end = !other.impl_ || other.impl_->at_end();
    if (this_end || other_end) {
        return this_end == other_end;
    }
    return impl_ == other.impl_;
}

CaseDiscoverer::CaseDiscoverer(std::filesystem::path root, DiscoveryOptions options, ConsoleLog& log)
    : root_{std::move(root)}, options_{std::move(options)}, log_{log} {
    require_directory(root_);
    if (!options_.is_primary) {
        options_.is_primary = suffix_predicate("raw.fits");
    }
}

CaseDiscoverer::Iterator CaseDiscoverer::begin() const {
    require_directory(root_);
    return Iterator{std::make_unique<Iterator::Impl>(*this)};
}

CaseDiscoverer::Iterator CaseDiscoverer::end() const {
    return Iterator{nullptr};
}

std::vector<TestCase> CaseDiscoverer::collect() const {
    std::vector<TestCase> cases;
    for (auto it = begin(); it != end(); ++it) {
        cases.push_back(*it);
    }
    return cases;
}

}  // namespace calregress
