#pragma once

#include <atomic>
#include <cmath>
#include <cstdint>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/errors.hpp"
#include "embedding/embedder.hpp"
#include "generation/text_generator.hpp"

namespace verirag::test {

// Unit vector in the plane whose cosine with (1, 0) is `score`.
inline std::vector<float> at_score(double score) {
    return {static_cast<float>(score), static_cast<float>(std::sqrt(1.0 - score * score))};
}

inline bool near(double a, double b, double tolerance = 1e-4) {
    return std::fabs(a - b) <= tolerance;
}

// Deterministic embedder. Registered texts map to fixed vectors; anything
// else gets a vector derived from its bytes.
class StubEmbedder final : public Embedder {
public:
    explicit StubEmbedder(int dimension = 2) : dimension_(dimension) {}

    void set(const std::string& text, std::vector<float> vector) {
        std::lock_guard<std::mutex> lock(mutex_);
        vectors_[text] = std::move(vector);
    }

    void fail_with(const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        failure_ = message;
    }

    std::vector<float> embed(const std::string& text) const override {
        calls_.fetch_add(1);
        std::lock_guard<std::mutex> lock(mutex_);
        if (!failure_.empty()) {
            throw EmbeddingUnavailable(failure_);
        }
        const auto it = vectors_.find(text);
        if (it != vectors_.end()) {
            return it->second;
        }
        std::vector<float> vector(static_cast<std::size_t>(dimension_), 0.0f);
        std::uint32_t state = 2166136261u;
        for (const char ch : text) {
            state = (state ^ static_cast<unsigned char>(ch)) * 16777619u;
            vector[state % vector.size()] += 1.0f;
        }
        vector[0] += 0.5f;
        return vector;
    }

    std::vector<std::vector<float>> embed_batch(const std::vector<std::string>& texts) const override {
        std::vector<std::vector<float>> vectors;
        for (const auto& text : texts) {
            vectors.push_back(embed(text));
        }
        return vectors;
    }

    int dimension() const override { return dimension_; }

    int calls() const { return calls_.load(); }

private:
    int dimension_;
    mutable std::mutex mutex_;
    std::map<std::string, std::vector<float>> vectors_;
    std::string failure_;
    mutable std::atomic<int> calls_{0};
};

// Returns a fixed completion and records the prompts it was given.
class StubGenerator final : public TextGenerator {
public:
    explicit StubGenerator(std::string reply = {}) : reply_(std::move(reply)) {}

    void reply_with(std::string reply) {
        std::lock_guard<std::mutex> lock(mutex_);
        reply_ = std::move(reply);
    }

    void fail_with(const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        failure_ = message;
    }

    std::string complete(const std::string& system_prompt, const std::string& user_prompt) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++calls_;
        last_system_ = system_prompt;
        last_user_ = user_prompt;
        if (!failure_.empty()) {
            throw GenerationUnavailable(failure_);
        }
        return reply_;
    }

    int calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    std::string last_user_prompt() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_user_;
    }

    std::string last_system_prompt() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_system_;
    }

private:
    mutable std::mutex mutex_;
    std::string reply_;
    std::string failure_;
    mutable int calls_ = 0;
    mutable std::string last_system_;
    mutable std::string last_user_;
};

// Runs `fn` and reports whether it threw an exception of type E.
template <typename E, typename Fn>
bool throws(Fn&& fn) {
    try {
        fn();
    } catch (const E&) {
        return true;
    }
    return false;
}

}  // namespace verirag::test
