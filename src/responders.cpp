#include "responders.h"
#include "utils.h"
#include <algorithm>
#include <utility>

using json = nlohmann::json;

namespace vortex_l0 {
namespace responders {

namespace {

const std::vector<std::string> STOP_WORDS = {
    "the", "and", "for", "with", "from", "that", "this", "nonexistent", "component"
};
constexpr size_t MIN_KEYWORD_LENGTH = 2;
constexpr size_t MIN_MATCH_COUNT = 2;
constexpr size_t PREVIEW_LENGTH = 100;

// Ordered: first matching topic wins
const std::vector<std::pair<std::string, std::string>> HELP_TOPICS = {
    {"social media", "Social Media: Platform-specific strategies, content calendars, hashtag research, viral mechanics"},
    {"campaign", "Campaign Management: Strategy development, multi-platform coordination, performance tracking"},
    {"content", "Content Creation: Research, planning, SEO optimization, visual design, distribution"},
    {"trends", "Trend Analysis: Real-time monitoring, hashtag research, competitive intelligence"},
    {"oauth", "OAuth Implementation: PKCE flow, secure token storage, refresh handling, best practices"},
    {"react", "React Patterns: Component design, state management, performance optimization, testing"},
};

const std::vector<std::pair<std::string, std::string>> CAMPAIGN_TYPES = {
    {"viral", "Viral Campaign Strategy"},
    {"product launch", "Product Launch Campaign"},
    {"brand awareness", "Brand Awareness Campaign"},
    {"engagement", "Engagement-Focused Campaign"},
};

bool is_stop_word(const std::string& word) {
    return std::find(STOP_WORDS.begin(), STOP_WORDS.end(), word) != STOP_WORDS.end();
}

Response no_match_response(const std::string& query) {
    Response r;
    r.message = "No code snippets found for \"" + query + "\". Try different keywords!";
    r.type = ResponseType::Snippet;
    r.related = {"floating card", "social scheduler", "trend analyzer"};
    return r;
}

std::vector<const CodeSnippet*> matching_snippets(const std::vector<std::string>& keywords) {
    std::vector<const CodeSnippet*> matches;
    const size_t required = std::min(MIN_MATCH_COUNT, keywords.size());

    for (const auto& snippet : snippet_catalog()) {
        const std::string title = utils::normalize_copy(snippet.title);
        const std::string content = utils::normalize_copy(snippet.content);
        const std::string tags = utils::normalize_copy(utils::join(snippet.tags, " "));

        // A single keyword hitting the title is enough
        bool title_match = std::any_of(keywords.begin(), keywords.end(),
            [&title](const std::string& kw) { return utils::contains(title, kw); });
        if (title_match && keywords.size() == 1) {
            matches.push_back(&snippet);
            continue;
        }

        size_t hits = static_cast<size_t>(std::count_if(keywords.begin(), keywords.end(),
            [&](const std::string& kw) {
                return utils::contains(title, kw) || utils::contains(tags, kw) || utils::contains(content, kw);
            }));
        if (hits >= required) {
            matches.push_back(&snippet);
        }
    }
    return matches;
}

} // namespace

const std::vector<CodeSnippet>& snippet_catalog() {
    static const std::vector<CodeSnippet> catalog = {
        {
            "floating-card-1",
            "Floating Black Card Component",
            "<div className=\"fixed bottom-4 right-4 bg-black rounded-lg shadow-xl p-4 text-white max-w-sm\">\n"
            "  <h3 className=\"font-medium\">Notification</h3>\n"
            "  <p className=\"text-sm opacity-75\">{message}</p>\n"
            "</div>",
            "react",
            {"ui", "floating", "notification", "card"},
            "2 days ago",
            "dashboard-redesign",
        },
        {
            "social-post-scheduler",
            "Social Media Post Scheduler",
            "const schedulePost = async (content, platforms, scheduledTime) => {\n"
            "  const post = { content, platforms: platforms.split(','), scheduledTime, status: 'scheduled' };\n"
            "  return await socialMediaAPI.schedule(post);\n"
            "};",
            "javascript",
            {"social-media", "scheduler", "automation"},
            "1 hour ago",
            "vortex-campaign-manager",
        },
        {
            "trend-analyzer",
            "Trending Topics Analyzer",
            "const analyzeTrends = async (platform, timeframe = '24h') => {\n"
            "  const trends = await trendingAPI.getTrends({ platform, timeframe, location: 'global' });\n"
            "  return trends.map(t => ({ hashtag: t.name, volume: t.tweet_volume, growth: t.growth_rate }));\n"
            "};",
            "javascript",
            {"trends", "social-media", "analytics"},
            "30 minutes ago",
            "trend-intelligence",
        },
    };
    return catalog;
}

const std::vector<StoredMemory>& memory_catalog() {
    static const std::vector<StoredMemory> catalog = {
        {
            "campaign-strategy-1",
            "Viral TikTok Campaign Strategy",
            "Key elements: Hook in first 3 seconds, trending audio, user-generated content encouragement, "
            "cross-platform promotion. Target: Gen Z, 16-24 age group.",
            "strategy",
            "today",
            {"tiktok", "viral", "strategy", "gen-z"},
        },
        {
            "content-calendar-1",
            "Q4 Content Calendar Framework",
            "Weekly themes: Monday motivation, Tuesday tips, Wednesday wins, Thursday throwback, Friday fun. "
            "Holiday content: Halloween, Black Friday, Cyber Monday, Christmas campaigns.",
            "planning",
            "yesterday",
            {"content-calendar", "q4", "holidays", "framework"},
        },
        {
            "oauth-implementation-1",
            "OAuth Integration Best Practices",
            "Use PKCE for public clients, implement proper state validation, secure token storage, "
            "refresh token rotation. Never expose client secrets in frontend.",
            "reference",
            "3 days ago",
            {"oauth", "security", "authentication", "best-practices"},
        },
    };
    return catalog;
}

std::vector<std::string> extract_keywords(const std::string& description) {
    std::vector<std::string> keywords;
    for (const auto& word : utils::split(utils::normalize_copy(description), ' ')) {
        if (word.size() > MIN_KEYWORD_LENGTH && !is_stop_word(word)) {
            keywords.push_back(word);
        }
    }
    return keywords;
}

Response get_help(const std::string& query) {
    const std::string lower = utils::normalize_copy(query);

    std::vector<std::string> all_topics;
    for (const auto& [topic, text] : HELP_TOPICS) {
        all_topics.push_back(topic);
    }

    for (const auto& [topic, text] : HELP_TOPICS) {
        if (!utils::contains(lower, topic)) continue;

        Response r = Response::make(text, ResponseType::Help);
        for (const auto& other : all_topics) {
            if (other != topic) r.related.push_back(other);
        }
        return r;
    }

    Response r = Response::make(
        "🌪️  VortexAI L0 can orchestrate: Social Media Campaigns, Content Creation, Trend Analysis, "
        "Code Development, and more. What would you like to orchestrate?",
        ResponseType::Help);
    r.related = all_topics;
    return r;
}

Response find_code(const std::string& description) {
    const auto keywords = extract_keywords(description);

    if (utils::contains(utils::normalize_copy(description), "nonexistent") || keywords.empty()) {
        return no_match_response(description);
    }

    const auto matches = matching_snippets(keywords);
    if (matches.empty()) {
        return no_match_response(description);
    }

    const CodeSnippet& best = *matches.front();

    Response r;
    r.message = "Found " + std::to_string(matches.size()) + " matching snippet"
        + (matches.size() > 1 ? "s" : "") + ":";
    r.type = ResponseType::Snippet;
    r.code = best.content;
    r.data = {
        {"title", best.title},
        {"language", best.language},
        {"lastUsed", best.last_used},
        {"project", best.project},
        {"tags", best.tags},
    };
    r.clipboard = true;
    r.dashboard_url = "/memories/" + best.id;
    for (size_t i = 1; i < matches.size() && i < 3; ++i) {
        r.related.push_back(matches[i]->title);
    }
    return r;
}

Response search_memories(const std::string& query) {
    // Empty pieces (doubled or edge spaces) are kept and match every memory.
    const std::vector<std::string> keywords = utils::split(utils::normalize_copy(query), ' ');

    std::vector<const StoredMemory*> matches;
    for (const auto& memory : memory_catalog()) {
        const std::string title = utils::normalize_copy(memory.title);
        const std::string content = utils::normalize_copy(memory.content);
        bool hit = std::any_of(keywords.begin(), keywords.end(), [&](const std::string& kw) {
            return utils::contains(title, kw) || utils::contains(content, kw)
                || std::any_of(memory.tags.begin(), memory.tags.end(),
                       [&kw](const std::string& tag) { return utils::contains(tag, kw); });
        });
        if (hit) matches.push_back(&memory);
    }

    if (matches.empty()) {
        Response r = Response::make(
            "No memories found for \"" + query + "\". Your knowledge base is growing!",
            ResponseType::Memory);
        r.related = {"campaign strategies", "content frameworks", "implementation guides"};
        return r;
    }

    std::vector<std::string> previews;
    for (const auto* m : matches) {
        previews.push_back(m->title + ": " + utils::utf8_prefix(m->content, PREVIEW_LENGTH) + "...");
    }

    Response r = Response::make(
        "Found " + std::to_string(matches.size()) + " relevant memories:", ResponseType::Memory);
    r.data = utils::join(previews, "\n\n");
    r.dashboard_url = "/memories?q=" + utils::url_encode(query);
    for (size_t i = 0; i < matches.size() && i < 3; ++i) {
        r.related.push_back(matches[i]->title);
    }
    return r;
}

Response orchestrate_campaign(const std::string& request) {
    const std::string lower = utils::normalize_copy(request);
    std::string campaign_name = "Social Media Campaign";
    for (const auto& [key, name] : CAMPAIGN_TYPES) {
        if (utils::contains(lower, key)) {
            campaign_name = name;
            break;
        }
    }

    Response r = Response::make("🎯 Orchestrating " + campaign_name, ResponseType::Campaign);
    r.workflow = {
        "📊 Market Research & Competitor Analysis",
        "🎨 Creative Strategy & Content Planning",
        "📱 Platform-Specific Content Creation",
        "⏰ Scheduling & Automation Setup",
        "📈 Analytics & Performance Tracking",
    };
    r.agents = {
        "Research Agent: Analyzing market trends and competitor strategies",
        "Creative Agent: Developing content themes and visual concepts",
        "Platform Agent: Optimizing for TikTok, Instagram, Twitter algorithms",
        "Analytics Agent: Setting up tracking and KPI dashboards",
    };
    r.data = {
        {"estimatedDuration", "2-3 weeks"},
        {"recommendedBudget", "$5,000 - $15,000"},
        {"expectedReach", "100K - 500K impressions"},
        {"keyPlatforms", {"TikTok", "Instagram", "Twitter"}},
    };
    r.related = {"content calendar", "hashtag research", "influencer outreach"};
    return r;
}

Response orchestrate_content(const std::string& /*request*/) {
    Response r = Response::make("📝 Orchestrating Content Creation Workflow", ResponseType::Orchestration);
    r.workflow = {
        "🔍 Topic Research & Trend Analysis",
        "📋 Content Outline & Structure Planning",
        "✍️  Draft Creation with SEO Optimization",
        "🎨 Visual Content & Graphics Creation",
        "📊 Review, Edit, and Performance Optimization",
    };
    r.agents = {
        "Research Agent: Identifying trending topics and keywords",
        "Content Agent: Creating outlines and drafts",
        "SEO Agent: Optimizing for search and discoverability",
        "Design Agent: Creating supporting visuals and graphics",
    };
    r.data = {
        {"contentTypes", {"Blog Posts", "Social Media Posts", "Video Scripts", "Email Campaigns"}},
        {"timeframe", "1-2 weeks per content piece"},
        {"deliverables", "High-quality, SEO-optimized content ready for publication"},
    };
    r.related = {"content calendar", "keyword research", "brand guidelines"};
    return r;
}

Response analyze_trends(const std::string& /*request*/) {
    Response r = Response::make("📈 Real-time Trend Analysis Complete", ResponseType::Orchestration);
    r.data = {
        {"trendingHashtags", json::array({
            {{"hashtag", "#EcoFriendly"}, {"volume", "2.3M"}, {"growth", "+45%"}},
            {{"hashtag", "#SustainableLiving"}, {"volume", "1.8M"}, {"growth", "+32%"}},
            {{"hashtag", "#GreenTech"}, {"volume", "856K"}, {"growth", "+28%"}},
        })},
        {"analysisTime", "Last 24 hours"},
        {"platforms", {"TikTok", "Instagram", "Twitter"}},
        {"recommendations", {
            "Focus on sustainability themes",
            "User-generated content opportunities",
            "Partner with eco-influencers",
        }},
    };
    r.workflow = {
        "📊 Data Collection from Multiple Platforms",
        "🧮 Trend Volume & Growth Analysis",
        "🎯 Relevance Scoring for Your Brand",
        "📝 Actionable Recommendations Generation",
    };
    r.related = {"hashtag strategy", "content calendar", "influencer research"};
    return r;
}

Response orchestrate_general(const std::string& request) {
    Response r = Response::make("🧠 L0 analyzing: \"" + request + "\"", ResponseType::Orchestration);
    r.workflow = {
        "🔍 Request Analysis & Intent Detection",
        "🤖 Agent Selection & Task Delegation",
        "⚡ Parallel Execution & Coordination",
        "📊 Results Aggregation & Optimization",
        "✅ Quality Check & Delivery",
    };
    r.agents = {
        "Orchestrator Agent: Managing workflow coordination",
        "Specialist Agents: Executing domain-specific tasks",
        "Quality Agent: Ensuring output standards",
        "Analytics Agent: Tracking performance metrics",
    };
    r.data = {
        {"requestType", "General Orchestration"},
        {"complexity", "Medium"},
        {"estimatedTime", "15-30 minutes"},
    };
    r.related = {
        "Use more specific keywords for better orchestration",
        "Try: \"create social campaign\" or \"analyze trends\"",
    };
    return r;
}

} // namespace responders
} // namespace vortex_l0
