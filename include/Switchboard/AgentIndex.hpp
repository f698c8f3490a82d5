// =================================================================
// include/Switchboard/AgentIndex.hpp
// =================================================================
// Process-wide index of validated agent profiles with TTL refresh.

#pragma once

#include <string>
#include <memory>
#include <unordered_map>
#include <vector>
#include <optional>
#include <chrono>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <atomic>

namespace Switchboard {

/**
 * @brief Validated description of one specialist agent
 */
struct AgentProfile {
    std::string id;                          ///< Unique agent identifier
    std::string name;                        ///< Display name
    std::string category;                    ///< Lower-cased domain category
    std::vector<std::string> keywords;       ///< Lower-cased trigger keywords
    std::vector<std::string> expertise;      ///< Expertise descriptions
    double confidence_threshold = 0.7;       ///< Trigger threshold in [0,1]
    double historical_success_rate = 80.0;   ///< Success rate in [0,100]
};

/**
 * @brief Category name to the domain-cue terms that signal it
 */
using CategoryCueMap = std::unordered_map<std::string, std::vector<std::string>>;

/**
 * @brief Immutable, published view of the index
 */
struct IndexSnapshot {
    std::vector<AgentProfile> profiles;               ///< Sorted by id
    CategoryCueMap category_cues;                     ///< Domain cues per category
    std::chrono::steady_clock::time_point loaded_at;  ///< When this snapshot was built
    std::string source;                               ///< File or label it came from
    bool is_fallback = false;                         ///< True for the built-in fallback profile

    /**
     * @brief Look up a profile by id
     * @return Pointer into this snapshot, or nullptr
     */
    const AgentProfile* findProfile(const std::string& agent_id) const;

    bool empty() const { return profiles.empty(); }
    size_t size() const { return profiles.size(); }
};

/**
 * @brief Agent index configuration
 */
struct IndexConfig {
    std::string agents_file = "config/agents.yml";   ///< Path to agent profiles
    std::chrono::seconds refresh_ttl{300};           ///< Snapshot time-to-live
    bool enable_background_refresh = false;          ///< Reload on TTL in a background thread
    bool enable_fallback_profile = true;             ///< Serve a single general profile when loading fails
    bool load_on_construct = true;                   ///< Load agents_file in the constructor
};

/**
 * @brief Outcome of one load or refresh
 */
struct IndexLoadResult {
    bool success = false;                  ///< New snapshot published from the source
    bool used_fallback = false;            ///< Built-in fallback profile was installed
    bool kept_previous = false;            ///< Load failed and the previous snapshot stayed live
    size_t loaded = 0;                     ///< Profiles accepted
    std::vector<std::string> rejected;     ///< "<id>: <reason>" for each rejected profile
    std::string error_message;             ///< Document-level failure
};

/**
 * @brief Holds AgentProfile records, refreshed on a TTL
 *
 * One writer (load/refresh) and many readers. Readers take a
 * shared_ptr<const IndexSnapshot> and keep using it while a refresh swaps in
 * a new one. Profiles are validated at load time against a closed field set.
 *
 * Accepted YAML layouts:
 * @code
 * agents:
 *   technical_support:
 *     name: "Technical Support"
 *     category: technical
 *     keywords: [webhook, ssl]
 *     expertise: ["SSL troubleshooting"]
 *     confidence_threshold: 0.7
 *     historical_success_rate: 92
 * categories:
 *   technical: [api, integration]
 * @endcode
 * or `agents:` as a sequence where every entry also carries `id`.
 */
class AgentIndex {
public:
    explicit AgentIndex(const IndexConfig& config = IndexConfig());

    virtual ~AgentIndex();

    AgentIndex(const AgentIndex&) = delete;
    AgentIndex& operator=(const AgentIndex&) = delete;

    /**
     * @brief Load the configured agents file
     * @return Load result
     * @throws ConfigError if nothing usable is available and the fallback is disabled
     */
    IndexLoadResult load();

    /**
     * @brief Load profiles from a YAML file
     * @param path Path to YAML file
     * @return Load result
     * @throws ConfigError if nothing usable is available and the fallback is disabled
     */
    IndexLoadResult loadFromFile(const std::string& path);

    /**
     * @brief Load profiles from YAML text
     * @param yaml_text YAML document
     * @param source Label recorded in the snapshot
     * @return Load result
     * @throws ConfigError if nothing usable is available and the fallback is disabled
     */
    IndexLoadResult loadFromString(const std::string& yaml_text, const std::string& source = "<inline>");

    /**
     * @brief Reload the configured file, keeping the previous snapshot on failure
     * @return Load result
     */
    IndexLoadResult refresh();

    /**
     * @brief Refresh if the current snapshot is older than the TTL
     *
     * A failed attempt that keeps the previous snapshot is not retried until
     * another full TTL has passed.
     *
     * @param now Current time
     * @return True if a refresh was attempted
     */
    bool refreshIfStale(std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());

    /**
     * @brief Current snapshot, never null after construction with load_on_construct
     */
    std::shared_ptr<const IndexSnapshot> snapshot() const;

    std::optional<AgentProfile> getProfile(const std::string& agent_id) const;
    std::vector<AgentProfile> getProfiles() const;
    size_t size() const;

    IndexLoadResult getLastLoadResult() const;

    /**
     * @brief Get agent info as formatted string (for CLI)
     * @param agent_id Agent identifier
     * @return Formatted agent information
     */
    std::string getAgentInfo(const std::string& agent_id) const;

    /**
     * @brief Get all agents info as formatted string (for CLI)
     */
    std::string getAllAgentsInfo() const;

    void setConfig(const IndexConfig& config);
    IndexConfig getConfig() const;

    /**
     * @brief Start background TTL refresh thread
     */
    void startRefreshThread();

    /**
     * @brief Stop background TTL refresh thread
     */
    void stopRefreshThread();

    /**
     * @brief Single general-purpose profile used when nothing else loads
     */
    static AgentProfile fallbackProfile();

    /**
     * @brief Built-in category cues
     */
    static CategoryCueMap defaultCategoryCues();

private:
    IndexConfig m_config;
    std::shared_ptr<const IndexSnapshot> m_snapshot;
    IndexLoadResult m_last_result;
    std::optional<std::chrono::steady_clock::time_point> m_last_refresh_attempt;
    mutable std::mutex m_mutex;
    std::mutex m_load_mutex;

    std::unique_ptr<std::thread> m_refresh_thread;
    std::atomic<bool> m_stop_refresh{false};
    std::mutex m_refresh_mutex;
    std::condition_variable m_refresh_cv;

    /**
     * @brief Parse a document into a snapshot and publish it on success
     * @param load_document Callable producing the YAML root node
     * @param source Label for logging and the snapshot
     */
    template <typename Loader>
    IndexLoadResult loadWith(Loader load_document, const std::string& source);

    void publish(std::shared_ptr<const IndexSnapshot> snapshot, const IndexLoadResult& result);
    void handleLoadFailure(IndexLoadResult& result, const std::string& source);
    void refreshLoop();
};

} // namespace Switchboard
