#pragma once

#ifdef __cplusplus

#include <cstddef>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace pqg {

// ============================================================================
// sequence<T> - lazy, finite, restartable result stream
// ============================================================================

/// A query result that is produced row by row. Each call to begin() asks the
/// factory for a fresh generator, so iterating twice re-runs the query.
/// The graph that produced the sequence must outlive it.
template<typename T>
class sequence {
public:
    using value_type = T;
    /// Returns the next element, or nullopt once the stream is exhausted
    using generator_t = std::function<std::optional<T>()>;
    using factory_t = std::function<generator_t()>;

    explicit sequence(factory_t factory) : factory_(std::move(factory)) {}

    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = T;
        using difference_type = std::ptrdiff_t;
        using pointer = const T*;
        using reference = const T&;

        iterator() = default;
        explicit iterator(generator_t gen)
            : gen_(std::make_shared<generator_t>(std::move(gen))) {
            advance();
        }

        reference operator*() const { return *current_; }
        pointer operator->() const { return &*current_; }

        iterator& operator++() {
            advance();
            return *this;
        }

        void operator++(int) { advance(); }

        bool operator==(const iterator& other) const {
            if (!current_ || !other.current_) {
                return current_.has_value() == other.current_.has_value();
            }
            return gen_ == other.gen_;
        }

    private:
        std::shared_ptr<generator_t> gen_;
        std::optional<T> current_;

        void advance() {
            if (gen_) {
                current_ = (*gen_)();
            } else {
                current_.reset();
            }
            if (!current_) gen_.reset();  // release the cursor early
        }
    };

    iterator begin() const { return iterator(factory_()); }
    iterator end() const { return iterator(); }

    /// Drain the whole sequence into a vector.
    std::vector<T> to_vector() const {
        std::vector<T> out;
        for (const auto& item : *this) {
            out.push_back(item);
        }
        return out;
    }

    /// Runs the query far enough to see one element.
    bool empty() const { return begin() == end(); }

private:
    factory_t factory_;
};

} // namespace pqg

#endif // __cplusplus
