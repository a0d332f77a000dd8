#ifndef DETECTION_HPP
#define DETECTION_HPP

#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * DetectionSet - Distinct labels seen in one inference cycle
 *
 * Duplicate labels collapse to one entry holding the highest confidence.
 */
struct DetectionSet {
    std::map<std::string, float> labels;  // label -> confidence
    double timestamp = 0.0;               // seconds since epoch

    void add(const std::string &label, float confidence = 1.0f) {
        auto it = labels.find(label);
        if (it == labels.end() || confidence > it->second) {
            labels[label] = confidence;
        }
    }

    bool contains(const std::string &label) const {
        return labels.find(label) != labels.end();
    }

    bool empty() const { return labels.empty(); }
    size_t size() const { return labels.size(); }

    std::vector<std::string> labelList() const {
        std::vector<std::string> out;
        out.reserve(labels.size());
        for (const auto &entry : labels) {
            out.push_back(entry.first);
        }
        return out;
    }
};

/**
 * Transient inference-engine failure. The detection loop logs it and
 * moves on to the next frame.
 */
class DetectionError : public std::runtime_error {
public:
    explicit DetectionError(const std::string &what) : std::runtime_error(what) {}
};

/**
 * DetectionSource - Boundary to the external inference engine
 */
class DetectionSource {
public:
    virtual ~DetectionSource() = default;

    /**
     * Block up to timeout_ms for the next detection set.
     * Returns nullopt if no frame arrived in time.
     * Throws DetectionError on engine failure.
     */
    virtual std::optional<DetectionSet> nextDetections(int timeout_ms) = 0;
};

#endif // DETECTION_HPP
