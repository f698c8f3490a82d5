// =================================================================
// src/Switchboard/AgentIndex.cpp
// =================================================================
// Implementation of the agent profile index.

#include "Switchboard/AgentIndex.hpp"
#include "Switchboard/Errors.hpp"
#include "Switchboard/Logger.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <sstream>
#include <iomanip>
#include <unordered_set>
#include <cctype>

namespace Switchboard {

namespace {

const std::unordered_set<std::string> kAllowedFields = {
    "id", "name", "category", "keywords", "expertise",
    "confidence_threshold", "historical_success_rate"
};

const std::vector<std::string> kRequiredFields = {
    "name", "category", "keywords", "confidence_threshold", "historical_success_rate"
};

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::vector<std::string> readStringList(const YAML::Node& node, const std::string& field, bool lower) {
    if (!node.IsSequence()) {
        throw std::invalid_argument("'" + field + "' must be a list");
    }
    std::vector<std::string> values;
    for (const auto& item : node) {
        std::string value = item.as<std::string>();
        values.push_back(lower ? toLower(value) : value);
    }
    return values;
}

/**
 * @brief Validate one profile node against the closed field set
 * @throws std::exception describing the first problem found
 */
AgentProfile parseProfile(const std::string& id, const YAML::Node& node) {
    if (id.empty()) {
        throw std::invalid_argument("missing id");
    }
    if (!node.IsMap()) {
        throw std::invalid_argument("profile must be a mapping");
    }

    for (YAML::const_iterator it = node.begin(); it != node.end(); ++it) {
        std::string key = it->first.as<std::string>();
        if (kAllowedFields.count(key) == 0) {
            throw std::invalid_argument("unknown field '" + key + "'");
        }
    }
    for (const auto& field : kRequiredFields) {
        if (!node[field]) {
            throw std::invalid_argument("missing required field '" + field + "'");
        }
    }

    AgentProfile profile;
    profile.id = id;
    profile.name = node["name"].as<std::string>();
    profile.category = toLower(node["category"].as<std::string>());
    profile.keywords = readStringList(node["keywords"], "keywords", true);
    if (node["expertise"]) {
        profile.expertise = readStringList(node["expertise"], "expertise", false);
    }
    profile.confidence_threshold = node["confidence_threshold"].as<double>();
    profile.historical_success_rate = node["historical_success_rate"].as<double>();

    if (profile.confidence_threshold < 0.0 || profile.confidence_threshold > 1.0) {
        throw std::out_of_range("confidence_threshold must be within [0,1]");
    }
    if (profile.historical_success_rate < 0.0 || profile.historical_success_rate > 100.0) {
        throw std::out_of_range("historical_success_rate must be within [0,100]");
    }

    return profile;
}

/**
 * @brief Build a snapshot from a parsed document, recording rejections
 * @return Snapshot, or nullptr when no profile survived validation
 */
std::shared_ptr<IndexSnapshot> buildSnapshot(const YAML::Node& root, const std::string& source,
                                             IndexLoadResult& result) {
    if (!root["agents"]) {
        result.error_message = "no 'agents' section in " + source;
        return nullptr;
    }

    auto snapshot = std::make_shared<IndexSnapshot>();
    snapshot->source = source;
    snapshot->category_cues = AgentIndex::defaultCategoryCues();

    std::unordered_set<std::string> seen_ids;
    auto accept = [&](const std::string& id, const YAML::Node& node) {
        try {
            AgentProfile profile = parseProfile(id, node);
            if (!seen_ids.insert(profile.id).second) {
                throw std::invalid_argument("duplicate agent id");
            }
            snapshot->profiles.push_back(std::move(profile));
        } catch (const std::exception& e) {
            std::string label = id.empty() ? "<unnamed>" : id;
            result.rejected.push_back(label + ": " + e.what());
            Logger::getInstance().warning("AgentIndex", "Rejected agent profile " + label, e.what());
        }
    };

    YAML::Node agents = root["agents"];
    if (agents.IsMap()) {
        for (YAML::const_iterator it = agents.begin(); it != agents.end(); ++it) {
            std::string id = it->first.as<std::string>();
            if (it->second.IsMap() && it->second["id"] && it->second["id"].as<std::string>() != id) {
                result.rejected.push_back(id + ": id field does not match key");
                Logger::getInstance().warning("AgentIndex", "Rejected agent profile " + id,
                    "id field does not match key");
                continue;
            }
            accept(id, it->second);
        }
    } else if (agents.IsSequence()) {
        for (const auto& entry : agents) {
            std::string id = (entry.IsMap() && entry["id"]) ? entry["id"].as<std::string>() : "";
            accept(id, entry);
        }
    } else {
        result.error_message = "'agents' must be a mapping or a list";
        return nullptr;
    }

    if (root["categories"]) {
        YAML::Node categories = root["categories"];
        for (YAML::const_iterator it = categories.begin(); it != categories.end(); ++it) {
            std::string category = toLower(it->first.as<std::string>());
            snapshot->category_cues[category] = readStringList(it->second, "categories." + category, true);
        }
    }

    if (snapshot->profiles.empty()) {
        result.error_message = "no valid agent profiles in " + source;
        return nullptr;
    }

    std::sort(snapshot->profiles.begin(), snapshot->profiles.end(),
              [](const AgentProfile& a, const AgentProfile& b) { return a.id < b.id; });

    snapshot->loaded_at = std::chrono::steady_clock::now();
    result.loaded = snapshot->profiles.size();
    result.success = true;
    return snapshot;
}

} // namespace

const AgentProfile* IndexSnapshot::findProfile(const std::string& agent_id) const {
    auto it = std::lower_bound(profiles.begin(), profiles.end(), agent_id,
        [](const AgentProfile& profile, const std::string& id) { return profile.id < id; });
    if (it != profiles.end() && it->id == agent_id) {
        return &(*it);
    }
    return nullptr;
}

AgentIndex::AgentIndex(const IndexConfig& config)
    : m_config(config) {

    if (m_config.load_on_construct) {
        load();
    }

    if (m_config.enable_background_refresh) {
        startRefreshThread();
    }
}

AgentIndex::~AgentIndex() {
    stopRefreshThread();
}

template <typename Loader>
IndexLoadResult AgentIndex::loadWith(Loader load_document, const std::string& source) {
    std::lock_guard<std::mutex> load_lock(m_load_mutex);

    IndexLoadResult result;
    std::shared_ptr<IndexSnapshot> snapshot;

    try {
        YAML::Node root = load_document();
        snapshot = buildSnapshot(root, source, result);
    } catch (const std::exception& e) {
        result.success = false;
        result.error_message = e.what();
    }

    if (snapshot) {
        publish(snapshot, result);
        Logger::getInstance().info("AgentIndex",
            "Loaded " + std::to_string(result.loaded) + " agent profiles",
            "Rejected: " + std::to_string(result.rejected.size()));
        return result;
    }

    handleLoadFailure(result, source);
    return result;
}

IndexLoadResult AgentIndex::load() {
    return loadFromFile(getConfig().agents_file);
}

IndexLoadResult AgentIndex::loadFromFile(const std::string& path) {
    Logger::getInstance().info("AgentIndex", "Loading agent profiles: " + path);
    return loadWith([&path]() { return YAML::LoadFile(path); }, path);
}

IndexLoadResult AgentIndex::loadFromString(const std::string& yaml_text, const std::string& source) {
    return loadWith([&yaml_text]() { return YAML::Load(yaml_text); }, source);
}

IndexLoadResult AgentIndex::refresh() {
    std::string path = getConfig().agents_file;
    Logger::getInstance().debug("AgentIndex", "Refreshing agent profiles: " + path);
    try {
        return loadFromFile(path);
    } catch (const ConfigError& e) {
        Logger::getInstance().error("AgentIndex", "Refresh failed", e.what());
        IndexLoadResult result;
        result.error_message = e.what();
        return result;
    }
}

bool AgentIndex::refreshIfStale(std::chrono::steady_clock::time_point now) {
    auto ttl = getConfig().refresh_ttl;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_snapshot) {
            if (now - m_snapshot->loaded_at < ttl) {
                return false;
            }
            // A kept snapshot waits a full TTL after the last failed attempt
            if (m_last_refresh_attempt && now - *m_last_refresh_attempt < ttl) {
                return false;
            }
        }
        m_last_refresh_attempt = now;
    }

    refresh();
    return true;
}

std::shared_ptr<const IndexSnapshot> AgentIndex::snapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_snapshot;
}

std::optional<AgentProfile> AgentIndex::getProfile(const std::string& agent_id) const {
    auto current = snapshot();
    if (!current) {
        return std::nullopt;
    }
    const AgentProfile* profile = current->findProfile(agent_id);
    if (!profile) {
        return std::nullopt;
    }
    return *profile;
}

std::vector<AgentProfile> AgentIndex::getProfiles() const {
    auto current = snapshot();
    return current ? current->profiles : std::vector<AgentProfile>{};
}

size_t AgentIndex::size() const {
    auto current = snapshot();
    return current ? current->size() : 0;
}

IndexLoadResult AgentIndex::getLastLoadResult() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_last_result;
}

std::string AgentIndex::getAgentInfo(const std::string& agent_id) const {
    auto profile = getProfile(agent_id);
    if (!profile) {
        return "Agent not found: " + agent_id;
    }

    std::stringstream ss;
    ss << "Agent: " << profile->id << "\n";
    ss << "  Name: " << profile->name << "\n";
    ss << "  Category: " << profile->category << "\n";
    ss << "  Threshold: " << std::fixed << std::setprecision(2) << profile->confidence_threshold << "\n";
    ss << "  Success Rate: " << std::setprecision(1) << profile->historical_success_rate << "%\n";

    ss << "  Keywords: ";
    for (size_t i = 0; i < profile->keywords.size(); ++i) {
        if (i > 0) ss << ", ";
        ss << profile->keywords[i];
    }
    ss << "\n";

    if (!profile->expertise.empty()) {
        ss << "  Expertise:\n";
        for (const auto& item : profile->expertise) {
            ss << "    - " << item << "\n";
        }
    }

    return ss.str();
}

std::string AgentIndex::getAllAgentsInfo() const {
    std::stringstream ss;
    auto current = snapshot();
    auto last = getLastLoadResult();

    ss << "Agent Index\n";
    ss << "===========\n";
    ss << "Source: " << (current ? current->source : "<none>") << "\n";
    ss << "Loaded: " << (current ? current->size() : 0) << "\n";
    ss << "Rejected: " << last.rejected.size() << "\n";
    if (current && current->is_fallback) {
        ss << "Serving built-in fallback profile\n";
    }
    for (const auto& rejection : last.rejected) {
        ss << "  ! " << rejection << "\n";
    }

    if (!current || current->empty()) {
        ss << "\nNo agents loaded.\n";
        return ss.str();
    }

    for (const auto& profile : current->profiles) {
        ss << "\n" << getAgentInfo(profile.id);
    }
    return ss.str();
}

void AgentIndex::setConfig(const IndexConfig& config) {
    bool refresh_changed;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        refresh_changed = (m_config.enable_background_refresh != config.enable_background_refresh);
        m_config = config;
    }

    if (refresh_changed) {
        if (config.enable_background_refresh) {
            startRefreshThread();
        } else {
            stopRefreshThread();
        }
    }
}

IndexConfig AgentIndex::getConfig() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_config;
}

void AgentIndex::startRefreshThread() {
    if (m_refresh_thread && m_refresh_thread->joinable()) {
        return; // Already running
    }

    m_stop_refresh = false;
    m_refresh_thread = std::make_unique<std::thread>(&AgentIndex::refreshLoop, this);
    Logger::getInstance().info("AgentIndex", "Started refresh thread");
}

void AgentIndex::stopRefreshThread() {
    {
        std::lock_guard<std::mutex> lock(m_refresh_mutex);
        m_stop_refresh = true;
    }
    m_refresh_cv.notify_all();

    if (m_refresh_thread && m_refresh_thread->joinable()) {
        m_refresh_thread->join();
        m_refresh_thread.reset();
        Logger::getInstance().info("AgentIndex", "Stopped refresh thread");
    }
}

AgentProfile AgentIndex::fallbackProfile() {
    AgentProfile profile;
    profile.id = "general_support";
    profile.name = "General Support";
    profile.category = "general";
    profile.keywords = {"help", "support", "question"};
    profile.expertise = {"General customer support"};
    profile.confidence_threshold = 0.3;
    profile.historical_success_rate = 80.0;
    return profile;
}

CategoryCueMap AgentIndex::defaultCategoryCues() {
    return {
        {"technical", {"api", "integration", "webhook", "ssl", "endpoint"}},
        {"billing", {"billing", "invoice", "payment", "refund", "charge"}},
        {"security", {"security", "vulnerability", "breach", "fraud", "password"}},
        {"account", {"account", "login", "profile"}}
    };
}

void AgentIndex::publish(std::shared_ptr<const IndexSnapshot> snapshot, const IndexLoadResult& result) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_snapshot = std::move(snapshot);
    m_last_result = result;
}

void AgentIndex::handleLoadFailure(IndexLoadResult& result, const std::string& source) {
    Logger::getInstance().error("AgentIndex", "Failed to load agent profiles: " + result.error_message, source);

    if (snapshot()) {
        result.kept_previous = true;
        Logger::getInstance().warning("AgentIndex", "Keeping previous agent index");
        std::lock_guard<std::mutex> lock(m_mutex);
        m_last_result = result;
        return;
    }

    if (!getConfig().enable_fallback_profile) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_last_result = result;
        }
        throw ConfigError("agent index unavailable: " + result.error_message);
    }

    auto fallback = std::make_shared<IndexSnapshot>();
    fallback->profiles.push_back(fallbackProfile());
    fallback->category_cues = defaultCategoryCues();
    fallback->loaded_at = std::chrono::steady_clock::now();
    fallback->source = "<fallback>";
    fallback->is_fallback = true;

    result.used_fallback = true;
    result.loaded = 1;
    Logger::getInstance().warning("AgentIndex", "Serving built-in fallback profile",
        fallback->profiles.front().id);

    publish(fallback, result);
}

void AgentIndex::refreshLoop() {
    while (!m_stop_refresh) {
        {
            std::unique_lock<std::mutex> lock(m_refresh_mutex);
            m_refresh_cv.wait_for(lock, getConfig().refresh_ttl, [this] {
                return m_stop_refresh.load();
            });
        }

        if (m_stop_refresh) {
            break;
        }

        refreshIfStale();
    }
}

} // namespace Switchboard
