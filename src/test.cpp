#include <evomemory/evomemory.hpp>
#include <nlohmann/json.hpp>
#include <sqlite3.h>
#include <iostream>
#include <atomic>
#include <cassert>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <thread>
#include <vector>

using namespace evomemory;

static bool near(float a, float b, float eps = 1e-4f) {
    return std::fabs(a - b) < eps;
}

// Fresh path under the system temp dir; stale database files are removed
static std::string temp_path(const std::string& name) {
    auto path = std::filesystem::temp_directory_path() / ("evomemory_test_" + name);
    for (const char* suffix : {"", "-wal", "-shm"}) {
        std::filesystem::remove(path.string() + suffix);
    }
    return path.string();
}

static NeuronId add(NeuronStore& store, const std::string& input, const std::string& output,
                    float confidence = 0.5f, int feedback = 0,
                    std::optional<std::string> skill = std::nullopt) {
    Neuron n(input, output, confidence);
    n.user_feedback = feedback;
    n.skill_id = std::move(skill);
    return store.save(n);
}

static bool has_trigger(const std::vector<Rule>& rules, const std::string& trigger) {
    for (const auto& r : rules) {
        if (r.trigger_pattern == trigger) return true;
    }
    return false;
}

static const Rule* find_trigger(const std::vector<Rule>& rules, const std::string& trigger) {
    for (const auto& r : rules) {
        if (r.trigger_pattern == trigger) return &r;
    }
    return nullptr;
}

// ═══════════════════════════════════════════════════════════════════════════
// Text
// ═══════════════════════════════════════════════════════════════════════════

void test_context_hash() {
    std::cout << "Testing context hash..." << std::endl;

    assert(md5_hex("") == "d41d8cd98f00b204e9800998ecf8427e");
    assert(md5_hex("abc") == "900150983cd24fb0d6963f7d28e17f72");

    // Normalization: trim + lower before hashing
    assert(context_hash(" Led ON ") == context_hash("led on"));
    assert(context_hash("ABC\n") == "90015098");
    assert(context_hash("led on").size() == 8);
    assert(context_hash("led on") != context_hash("led off"));

    // Accented capitals fold like their ASCII neighbours
    assert(context_hash("PERCHÉ") == "9ec9c29b");
    assert(context_hash("perché") == "9ec9c29b");
    assert(context_hash(" CITTÀ ") == "d0e058a4");
    assert(context_hash("città") == "d0e058a4");
    assert(context_hash("È acceso il LED?") == context_hash("è acceso il led?"));
    assert(to_lower_latin1("2×3") == "2×3");
    assert(to_lower("PERCHÉ") == "perchÉ");

    std::cout << "  PASS" << std::endl;
}

void test_safe_save_concurrent() {
    std::cout << "Testing concurrent safe_save..." << std::endl;

    std::string path = temp_path("safe_save.txt");
    const std::string a(64 * 1024, 'a');
    const std::string b(64 * 1024, 'b');

    std::vector<std::thread> threads;
    std::atomic<int> failures{0};
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < 20; ++i) {
                if (!safe_save(path, (t % 2) ? a : b)) failures++;
            }
        });
    }
    for (auto& th : threads) th.join();
    assert(failures == 0);

    // Whole contents of one writer, never a mix or a truncation
    std::ifstream in(path, std::ios::binary);
    std::string got((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    assert(got == a || got == b);

    // No temp files left behind
    auto dir = std::filesystem::path(path).parent_path();
    std::string prefix = std::filesystem::path(path).filename().string() + ".tmp.";
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        assert(entry.path().filename().string().rfind(prefix, 0) != 0);
    }
    std::filesystem::remove(path);

    std::cout << "  PASS" << std::endl;
}

void test_tokenize() {
    std::cout << "Testing tokenize..." << std::endl;

    auto tokens = tokenize("Come controllo un LED?");
    assert(tokens.size() == 4);
    assert(tokens[0] == "come");
    assert(tokens[3] == "led");

    auto edges = tokenize("  (hello), world...  ?! ");
    assert(edges.size() == 2);
    assert(edges[0] == "hello");
    assert(edges[1] == "world");

    assert(utf8_length("è") == 1);
    assert(utf8_length("22.5°C") == 6);
    assert(utf8_truncate("àèìòù", 2) == "àè");
    assert(utf8_truncate("abc", 10) == "abc");

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// ConfidenceScorer
// ═══════════════════════════════════════════════════════════════════════════

void test_scorer_bounds() {
    std::cout << "Testing scorer bounds..." << std::endl;

    ConfidenceScorer scorer;
    std::vector<std::string> texts = {
        "",
        "?",
        "maybe maybe maybe maybe maybe maybe maybe maybe",
        "forse forse forse? probabilmente? non so? could be?",
        "certainly definitely clearly obviously certainly definitely clearly obviously "
        "certainly definitely clearly obviously, sicuramente certamente essenzialmente",
        "on off on off on off on off on off on off on off on off",
        std::string(5000, 'x'),
    };
    GenerationStats stats;
    stats.prompt_tokens = 2000;
    stats.tokens_per_second = 50.0;

    for (const auto& t : texts) {
        float c1 = scorer.score(t).confidence;
        float c2 = scorer.score(t, stats).confidence;
        assert(c1 >= 0.0f && c1 <= 1.0f);
        assert(c2 >= 0.0f && c2 <= 1.0f);
    }

    assert(scorer.score("maybe maybe maybe maybe maybe maybe maybe maybe").confidence == 0.0f);

    std::cout << "  PASS" << std::endl;
}

void test_scorer_uncertain_italian() {
    std::cout << "Testing scorer uncertainty (italian)..." << std::endl;

    ConfidenceScorer scorer;
    auto result = scorer.score("Non sono sicuro, forse è il pin 17");
    assert(result.confidence < 0.45f);
    assert(near(result.confidence, 0.2f));
    assert(result.reasoning == "found 2 uncertainty expressions");
    assert(scorer.should_ask_clarification(result.confidence));

    std::cout << "  PASS" << std::endl;
}

void test_scorer_certain_italian() {
    std::cout << "Testing scorer certainty (italian)..." << std::endl;

    ConfidenceScorer scorer;
    auto result = scorer.score("Certamente! Il comando corretto è gpio.write(17, HIGH).");
    assert(result.confidence >= 0.6f);
    assert(near(result.confidence, 0.7f));
    assert(result.reasoning == "detailed response; found 1 certainty expressions");
    assert(!scorer.should_ask_clarification(result.confidence));

    std::cout << "  PASS" << std::endl;
}

void test_scorer_adjustments() {
    std::cout << "Testing scorer adjustments..." << std::endl;

    ConfidenceScorer scorer;

    auto neutral = scorer.score("The pin is configured as output");
    assert(near(neutral.confidence, 0.5f));
    assert(neutral.reasoning == "standard evaluation");

    auto empty = scorer.score("   ");
    assert(near(empty.confidence, 0.3f));
    assert(empty.reasoning == "output too short");

    auto questions = scorer.score("Which pin? Which mode?");
    assert(near(questions.confidence, 0.4f));
    assert(questions.reasoning == "response contains questions");

    // One question mark is fine
    assert(near(scorer.score("Which pin do you mean?").confidence, 0.5f));

    auto looping = scorer.score("on off on off on off on off on off on");
    assert(near(looping.confidence, 0.35f));
    assert(looping.reasoning == "too many repetitions");

    // Ten words are never judged for repetition
    assert(near(scorer.score("on off on off on off on off on off").confidence, 0.5f));

    // Word boundaries: "maybelline" is not "maybe"
    assert(near(scorer.score("Try the maybelline pin").confidence, 0.5f));

    std::cout << "  PASS" << std::endl;
}

void test_scorer_generation_stats() {
    std::cout << "Testing scorer generation stats..." << std::endl;

    ConfidenceScorer scorer;

    GenerationStats stats;
    stats.prompt_tokens = 800;
    stats.tokens_per_second = 12.0;
    auto result = scorer.score("Short reply here", stats);
    assert(near(result.confidence, 0.45f));
    assert(result.reasoning == "response too short for the prompt; fluent generation");

    // Missing fields just skip their adjustment
    GenerationStats partial;
    partial.tokens_per_second = 2.0;
    auto degraded = scorer.score("Short reply here", partial);
    assert(near(degraded.confidence, 0.5f));
    assert(degraded.reasoning == "standard evaluation");

    std::cout << "  PASS" << std::endl;
}

void test_scorer_labels_and_config() {
    std::cout << "Testing scorer labels and config..." << std::endl;

    assert(std::string(ConfidenceScorer::label(0.95f)) == "very-high");
    assert(std::string(ConfidenceScorer::label(0.8f)) == "very-high");
    assert(std::string(ConfidenceScorer::label(0.6f)) == "high");
    assert(std::string(ConfidenceScorer::label(0.4f)) == "medium");
    assert(std::string(ConfidenceScorer::label(0.2f)) == "low");
    assert(std::string(ConfidenceScorer::label(0.1f)) == "very-low");

    assert(ConfidenceScorer::should_ask_clarification(0.39f, 0.4f));
    assert(!ConfidenceScorer::should_ask_clarification(0.4f, 0.4f));
    assert(ConfidenceScorer::should_ask_clarification(0.55f, 0.6f));

    assert(std::string(mood_name(Mood::Positive)) == "positive");
    assert(std::string(mood_name(Mood::Neutral)) == "neutral");
    assert(std::string(mood_name(Mood::Negative)) == "negative");

    // Defaults are visible and overridable
    ScorerConfig defaults;
    assert(near(defaults.baseline, 0.5f));
    assert(defaults.short_output_chars == 10);
    assert(near(defaults.uncertainty_delta, -0.15f));
    assert(near(defaults.clarification_threshold, 0.4f));

    ScorerConfig relaxed;
    relaxed.short_output_chars = 3;
    relaxed.clarification_threshold = 0.2f;
    ConfidenceScorer scorer(relaxed);
    assert(near(scorer.score("hey!").confidence, 0.5f));
    assert(!scorer.should_ask_clarification(0.3f));

    // A malformed phrase pattern is a config error
    ScorerConfig broken;
    broken.certainty_phrases = {"c++"};
    bool threw = false;
    try {
        ConfidenceScorer bad(broken);
    } catch (const ValidationError&) {
        threw = true;
    }
    assert(threw);

    ScorerConfig escaped;
    escaped.certainty_phrases = {"c\\+\\+ code"};
    assert(near(ConfidenceScorer(escaped).score("use c++ code").confidence, 0.6f));

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// NeuronStore
// ═══════════════════════════════════════════════════════════════════════════

void test_store_save_get() {
    std::cout << "Testing NeuronStore save/get..." << std::endl;

    NeuronStore store(":memory:");
    store.open();

    Neuron n("Accendi il LED", "OK, GPIO 17 attivo", 0.82f);
    n.idea = "turn on pin 17";
    n.skill_id = "gpio";
    NeuronId id = store.save(n);
    assert(id > 0);

    auto got = store.get(id);
    assert(got.has_value());
    assert(got->input_text == "Accendi il LED");
    assert(got->output_text == "OK, GPIO 17 attivo");
    assert(near(got->confidence, 0.82f));
    assert(got->idea && *got->idea == "turn on pin 17");
    assert(got->skill_id && *got->skill_id == "gpio");
    assert(got->mood == Mood::Neutral);
    assert(got->context_hash == context_hash("accendi il led"));
    assert(got->timestamp > 0);
    assert(got->last_accessed == got->timestamp);
    assert(got->access_count == 0);

    assert(!store.get(id + 100).has_value());

    // Optional fields read back as absent
    NeuronId bare = add(store, "ping", "pong");
    auto bare_got = store.get(bare);
    assert(!bare_got->idea.has_value());
    assert(!bare_got->skill_id.has_value());

    assert(store.count() == 2);

    std::cout << "  PASS" << std::endl;
}

void test_store_validation() {
    std::cout << "Testing NeuronStore validation..." << std::endl;

    NeuronStore store(":memory:");
    store.open();

    bool threw = false;
    try {
        add(store, "in", "out", 1.5f);
    } catch (const ValidationError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        add(store, "in", "out", std::nanf(""));
    } catch (const ValidationError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        add(store, "in", "out", 0.5f, 2);
    } catch (const ValidationError&) {
        threw = true;
    }
    assert(threw);

    // Nothing was written
    assert(store.count() == 0);

    // Boundaries are valid
    add(store, "in", "out", 0.0f);
    add(store, "in", "out", 1.0f);
    assert(store.count() == 2);

    std::cout << "  PASS" << std::endl;
}

void test_store_recent_order() {
    std::cout << "Testing NeuronStore recent..." << std::endl;

    NeuronStore store(":memory:");
    store.open();

    Timestamp base = now() - 10000;
    std::vector<std::pair<Timestamp, std::string>> rows = {
        {base + 1000, "gpio"}, {base + 3000, "sensors"}, {base + 2000, "gpio"}};
    std::vector<NeuronId> ids;
    for (const auto& [ts, skill] : rows) {
        Neuron n("question", "answer");
        n.timestamp = ts;
        n.skill_id = skill;
        ids.push_back(store.save(n));
    }

    auto recent = store.recent(10);
    assert(recent.size() == 3);
    assert(recent[0].id == ids[1]);
    assert(recent[1].id == ids[2]);
    assert(recent[2].id == ids[0]);
    assert(recent[0].timestamp == base + 3000);

    auto limited = store.recent(1);
    assert(limited.size() == 1);
    assert(limited[0].id == ids[1]);

    auto gpio = store.recent(10, std::string("gpio"));
    assert(gpio.size() == 2);
    assert(gpio[0].id == ids[2]);

    assert(store.recent(10, std::string("audio")).empty());

    std::cout << "  PASS" << std::endl;
}

void test_store_similar_search() {
    std::cout << "Testing NeuronStore similar/search..." << std::endl;

    NeuronStore store(":memory:");
    store.open();

    NeuronId low = add(store, "LED on", "turning on", 0.4f);
    NeuronId high = add(store, "  led ON ", "done", 0.9f);
    add(store, "led off", "turning off", 0.95f);
    NeuronId percent = add(store, "progress", "100% done", 0.6f);
    add(store, "progress", "1000 units", 0.7f);

    auto similar = store.similar(context_hash("Led on"), 5);
    assert(similar.size() == 2);
    assert(similar[0].id == high);
    assert(similar[1].id == low);

    assert(store.similar("ffffffff", 5).empty());

    // Case-insensitive, over input or output
    auto led = store.search("LED", 10);
    assert(led.size() == 3);
    assert(led[0].confidence >= led[1].confidence);
    auto turning = store.search("turning", 10);
    assert(turning.size() == 2);

    // LIKE wildcards are literal
    auto literal = store.search("100%", 10);
    assert(literal.size() == 1);
    assert(literal[0].id == percent);
    assert(store.search("_", 10).empty());

    assert(store.search("LED", 1).size() == 1);

    std::cout << "  PASS" << std::endl;
}

void test_store_feedback_mood() {
    std::cout << "Testing NeuronStore feedback/mood..." << std::endl;

    NeuronStore store(":memory:");
    store.open();

    Neuron old("in", "out");
    old.timestamp = now() - MS_PER_DAY;
    NeuronId id = store.save(old);
    Timestamp before = store.get(id)->last_accessed;

    bool ok = store.update_feedback(id, 1);
    assert(ok);
    auto n = store.get(id);
    assert(n->user_feedback == 1);
    assert(n->mood == Mood::Positive);
    assert(n->last_accessed > before);

    store.update_feedback(id, -1);
    assert(store.get(id)->mood == Mood::Negative);

    store.update_feedback(id, 0);
    assert(store.get(id)->mood == Mood::Neutral);

    bool missing = store.update_feedback(id + 100, 1);
    assert(!missing);

    bool threw = false;
    try {
        store.update_feedback(id, 5);
    } catch (const ValidationError&) {
        threw = true;
    }
    assert(threw);
    assert(store.get(id)->user_feedback == 0);

    // Mood follows feedback at save time too
    NeuronId disliked = add(store, "in", "out", 0.5f, -1);
    assert(store.get(disliked)->mood == Mood::Negative);

    std::cout << "  PASS" << std::endl;
}

void test_store_prune() {
    std::cout << "Testing NeuronStore prune..." << std::endl;

    NeuronStore store(":memory:");
    store.open();

    Timestamp old_ts = now() - 40 * MS_PER_DAY;
    auto add_at = [&](float conf, int feedback, Timestamp ts) {
        Neuron n("in", "out", conf);
        n.user_feedback = feedback;
        n.timestamp = ts;
        return store.save(n);
    };

    NeuronId doomed = add_at(0.1f, 0, old_ts);
    NeuronId disliked = add_at(0.1f, -1, old_ts);
    NeuronId loved = add_at(0.1f, 1, old_ts);
    NeuronId confident = add_at(0.9f, 0, old_ts);
    NeuronId fresh = add_at(0.1f, 0, now() - 1000);

    int64_t deleted = store.prune(30, 0.3f);
    assert(deleted == 2);
    assert(!store.get(doomed).has_value());
    assert(!store.get(disliked).has_value());
    assert(store.get(loved).has_value());
    assert(store.get(confident).has_value());
    assert(store.get(fresh).has_value());

    // Positive feedback survives any criteria
    int64_t aggressive = store.prune(0, 1.0f);
    assert(aggressive == 2);
    assert(store.get(loved).has_value());
    assert(store.count() == 1);

    bool threw = false;
    try {
        store.prune(-1, 0.3f);
    } catch (const ValidationError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

void test_store_access_and_stats() {
    std::cout << "Testing NeuronStore access/stats..." << std::endl;

    NeuronStore store(":memory:");
    store.open();

    NeuronId a = add(store, "a", "alpha", 0.6f);
    NeuronId b = add(store, "b", "beta", 0.8f);

    Neuron stale("c", "gamma", 0.1f);
    stale.timestamp = now() - 10 * MS_PER_DAY;
    store.save(stale);

    size_t touched = store.record_access({a, a, b, 9999});
    assert(touched == 3);
    assert(store.get(a)->access_count == 2);
    assert(store.get(b)->access_count == 1);
    assert(store.record_access({}) == 0);

    Rule rule("Use high confidence for gpio tasks", "skill_id:gpio", 0.9f, 2);
    store.insert_rule_if_absent(rule);
    Skill skill;
    skill.id = "gpio";
    store.upsert_skill(skill);

    StoreStats s = store.stats();
    assert(s.neurons == 3);
    assert(s.meta_neurons == 0);
    assert(s.rules == 1);
    assert(s.skills == 1);
    // Only the last 7 days count toward the average
    assert(near(s.avg_confidence, 0.7f));

    assert(store.count_meta_neurons() == 0);

    std::cout << "  PASS" << std::endl;
}

void test_store_rules() {
    std::cout << "Testing NeuronStore rules..." << std::endl;

    NeuronStore store(":memory:");
    store.open();

    Rule low("High confidence pattern detected for 'servo' queries", "keyword:servo", 0.8f, 1);
    Rule high("Avoid using 'honestly' in responses (negative feedback pattern)",
              "avoid_word:honestly", 0.3f, 3);

    bool first = store.insert_rule_if_absent(low);
    bool again = store.insert_rule_if_absent(low);
    bool other = store.insert_rule_if_absent(high);
    assert(first);
    assert(!again);
    assert(other);

    assert(store.rule_exists(low.rule_text));
    assert(!store.rule_exists("High confidence pattern detected for 'servo' queries "));

    auto rules = store.rules();
    assert(rules.size() == 2);
    assert(rules[0].priority == 3);
    assert(rules[0].trigger_pattern == "avoid_word:honestly");
    assert(near(rules[0].confidence_threshold, 0.3f));
    assert(rules[0].enabled);
    assert(rules[0].created_at > 0);
    assert(rules[1].priority == 1);

    Rule disabled("Ask clarification for 'quantum' topics (low confidence pattern)",
                  "clarify:quantum", 0.4f, 2);
    disabled.enabled = false;
    store.insert_rule_if_absent(disabled);
    assert(store.rules().size() == 3);
    assert(store.rules(true).size() == 2);

    bool threw = false;
    try {
        store.insert_rule_if_absent(Rule("bad", "x", 0.5f, 0));
    } catch (const ValidationError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

void test_store_skills() {
    std::cout << "Testing NeuronStore skills..." << std::endl;

    NeuronStore store(":memory:");
    store.open();

    Skill gpio;
    gpio.id = "gpio";
    gpio.name = "GPIO control";
    gpio.description = "Pins and relays";
    store.upsert_skill(gpio);

    Skill audio;
    audio.id = "audio";
    store.upsert_skill(audio);

    add(store, "a", "x", 0.9f, 0, std::string("gpio"));
    add(store, "b", "y", 0.7f, 0, std::string("gpio"));
    add(store, "c", "z", 0.4f, 0, std::string("sensors"));

    auto skills = store.skills();
    assert(skills.size() == 3);
    // Sorted by id
    assert(skills[0].id == "audio");
    assert(skills[0].name == "audio");
    assert(skills[0].neuron_count == 0);
    assert(skills[1].id == "gpio");
    assert(skills[1].name == "GPIO control");
    assert(skills[1].neuron_count == 2);
    assert(near(skills[1].avg_confidence, 0.8f));
    assert(skills[2].id == "sensors");
    assert(skills[2].neuron_count == 1);

    gpio.name = "General purpose I/O";
    store.upsert_skill(gpio);
    assert(store.skills()[1].name == "General purpose I/O");

    bool threw = false;
    try {
        store.upsert_skill(Skill{});
    } catch (const ValidationError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

void test_store_persistence() {
    std::cout << "Testing NeuronStore persistence..." << std::endl;

    std::string path = temp_path("persist/neurons.db");
    NeuronId id = 0;
    {
        NeuronStore store(path);
        store.open();
        id = add(store, "Spegni il LED", "OK, GPIO 17 su LOW", 0.75f);
        store.insert_rule_if_absent(Rule("Use high confidence for gpio tasks", "skill_id:gpio", 0.9f, 2));
        store.close();
        assert(!store.is_open());
    }
    {
        NeuronStore store(path);
        store.open();
        auto n = store.get(id);
        assert(n.has_value());
        assert(n->output_text == "OK, GPIO 17 su LOW");
        assert(store.rules().size() == 1);
    }

    std::filesystem::remove_all(std::filesystem::path(path).parent_path());

    std::cout << "  PASS" << std::endl;
}

void test_store_errors() {
    std::cout << "Testing NeuronStore errors..." << std::endl;

    // Not opened
    NeuronStore closed(":memory:");
    bool threw = false;
    try {
        closed.count();
    } catch (const StorageError&) {
        threw = true;
    }
    assert(threw);

    // Database written by a newer schema
    std::string path = temp_path("future.db");
    {
        sqlite3* db = nullptr;
        int rc = sqlite3_open(path.c_str(), &db);
        assert(rc == SQLITE_OK);
        rc = sqlite3_exec(db, "PRAGMA user_version = 99", nullptr, nullptr, nullptr);
        assert(rc == SQLITE_OK);
        sqlite3_close(db);
    }

    NeuronStore future(path);
    threw = false;
    try {
        future.open();
    } catch (const StorageError& e) {
        threw = std::string(e.what()).find("schema too new") != std::string::npos;
    }
    assert(threw);
    assert(!future.is_open());

    std::filesystem::remove(path);

    std::cout << "  PASS" << std::endl;
}

void test_store_concurrent_saves() {
    std::cout << "Testing NeuronStore concurrent saves..." << std::endl;

    NeuronStore store(":memory:");
    store.open();

    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&store, t] {
            for (int i = 0; i < 25; ++i) {
                add(store, "worker " + std::to_string(t), "item " + std::to_string(i));
            }
        });
    }
    for (auto& w : workers) w.join();

    assert(store.count() == 100);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// RetrievalIndex
// ═══════════════════════════════════════════════════════════════════════════

void test_retrieval_ranking() {
    std::cout << "Testing RetrievalIndex ranking..." << std::endl;

    NeuronStore store(":memory:");
    store.open();

    NeuronId gpio = add(store, "gpio pin setup", "configure the gpio pin");
    NeuronId weather = add(store, "weather today", "sunny and warm");
    add(store, "cooking pasta", "boil salted water");

    RetrievalIndex index(store);
    assert(!index.indexed());

    auto results = index.retrieve("gpio pin", 5);
    assert(index.indexed());
    assert(results.size() == 3);
    assert(results[0].neuron.id == gpio);
    assert(results[0].score > 0.0f);

    for (const auto& r : results) {
        if (r.neuron.id == weather) assert(r.score == 0.0f);
    }

    // Unknown terms contribute nothing
    auto none = index.retrieve("zebra", 5);
    for (const auto& r : none) assert(r.score == 0.0f);

    assert(index.retrieve("gpio", 1).size() == 1);

    std::cout << "  PASS" << std::endl;
}

void test_retrieval_bm25_formula() {
    std::cout << "Testing Bm25Snapshot formula..." << std::endl;

    std::vector<Neuron> docs = {
        Neuron("set the thermostat", "thermostat set to twenty"),
        Neuron("open the door", "door is now open"),
        Neuron("turn on lights", "lights are on now"),
    };
    Bm25Snapshot snap(docs);
    assert(snap.size() == 3);
    assert(near(snap.avg_doc_length(), 7.0f));

    // idf = ln((N - df + 0.5) / (df + 0.5) + 1)
    float idf = std::log((3.0f - 1.0f + 0.5f) / (1.0f + 0.5f) + 1.0f);
    assert(near(snap.idf("thermostat"), idf));
    assert(snap.idf("zebra") == 0.0f);

    // tf = 2, |doc| = avg: idf * 2 * 2.5 / (2 + 1.5)
    float expected = idf * 2.0f * 2.5f / 3.5f;
    assert(near(snap.score({"thermostat"}, 0), expected));
    assert(snap.score({"thermostat"}, 1) == 0.0f);

    std::cout << "  PASS" << std::endl;
}

void test_retrieval_led_scenario() {
    std::cout << "Testing RetrievalIndex LED scenario..." << std::endl;

    NeuronStore store(":memory:");
    store.open();

    NeuronId red = add(store, "Accendi il LED rosso", "OK, GPIO 17 attivo");
    NeuronId off = add(store, "Spegni il LED", "OK, GPIO 17 su LOW");
    add(store, "Che temperatura fa?", "22.5°C");

    RetrievalIndex index(store);
    auto results = index.retrieve("Come controllo un LED?", 3);
    assert(!results.empty());
    assert(results[0].neuron.id == red || results[0].neuron.id == off);
    assert(results[0].score > 0.0f);

    std::cout << "  PASS" << std::endl;
}

void test_retrieval_boosts() {
    std::cout << "Testing RetrievalIndex boosts..." << std::endl;

    NeuronStore store(":memory:");
    store.open();

    NeuronId confident = add(store, "relay module wiring", "connect relay to pin", 0.9f);
    NeuronId liked = add(store, "relay module wiring", "connect relay to pin", 0.5f, 1);
    NeuronId both = add(store, "relay module wiring", "connect relay to pin", 0.9f, 1);
    add(store, "unrelated stuff here", "nothing to see", 0.5f);
    add(store, "another topic", "more filler words", 0.5f);

    RetrievalIndex index(store);
    auto results = index.retrieve("relay", 5);
    assert(results[0].neuron.id == both);
    assert(results[1].neuron.id == liked);
    assert(results[2].neuron.id == confident);

    // Same base score, multiplied independently
    float base = results[2].score / 1.2f;
    assert(near(results[1].score, base * 1.3f));
    assert(near(results[0].score, base * 1.2f * 1.3f));

    std::cout << "  PASS" << std::endl;
}

void test_retrieval_context_below_threshold() {
    std::cout << "Testing RetrievalIndex context below threshold..." << std::endl;

    NeuronStore store(":memory:");
    store.open();

    // A term present in every document has a tiny idf
    for (int i = 0; i < 10; ++i) {
        add(store, "sensor reading " + std::to_string(i), "value " + std::to_string(i));
    }

    RetrievalIndex index(store);
    PromptContext ctx = index.build_prompt_context("sensor", 300);
    assert(ctx.best_score > 0.0f);
    assert(ctx.best_score < 0.5f);
    assert(ctx.text.empty());
    assert(ctx.neuron_ids.empty());

    assert(index.get_context_for_prompt("sensor") == "");
    assert(index.get_context_for_prompt("nothing matches this") == "");

    // Empty store
    NeuronStore empty(":memory:");
    empty.open();
    RetrievalIndex empty_index(empty);
    assert(empty_index.get_context_for_prompt("sensor") == "");
    assert(empty_index.retrieve("sensor").empty());

    std::cout << "  PASS" << std::endl;
}

void test_retrieval_context_format() {
    std::cout << "Testing RetrievalIndex context format..." << std::endl;

    NeuronStore store(":memory:");
    store.open();

    NeuronId thermo = add(store, "set the thermostat", "thermostat set to twenty");
    add(store, "open the door", "door is now open");
    add(store, "turn on lights", "lights are on now");

    RetrievalIndex index(store);
    std::string text = index.get_context_for_prompt("thermostat");
    assert(text.rfind("### Relevant past experiences:\n- Input: set the thermostat\n"
                      "  Output: thermostat set to twenty\n  (confidence: 0.50)", 0) == 0);
    assert(text.size() > 2 && text.substr(text.size() - 2) == "\n\n");

    PromptContext full = index.build_prompt_context("thermostat", 300);
    assert(full.neuron_ids.size() == 3);
    assert(full.neuron_ids[0] == thermo);

    // Budget: first output is 24 chars (~6 tokens), the next would overflow
    PromptContext tight = index.build_prompt_context("thermostat", 7);
    assert(tight.neuron_ids.size() == 1);
    assert(tight.neuron_ids[0] == thermo);

    // No block fits
    assert(index.get_context_for_prompt("thermostat", 0) == "");

    // Long texts are truncated in the block
    NeuronStore long_store(":memory:");
    long_store.open();
    add(long_store, "thermostat " + std::string(300, 'a'), "thermostat " + std::string(300, 'b'));
    add(long_store, "door", "open");
    add(long_store, "lights", "on");
    RetrievalIndex long_index(long_store);
    std::string clipped = long_index.get_context_for_prompt("thermostat", 1000);
    assert(!clipped.empty());
    assert(clipped.find(std::string(101, 'a')) == std::string::npos);
    assert(clipped.find(std::string(89, 'a')) != std::string::npos);
    assert(clipped.find(std::string(140, 'b')) == std::string::npos);
    assert(clipped.find(std::string(139, 'b')) != std::string::npos);

    std::cout << "  PASS" << std::endl;
}

void test_retrieval_reindex_and_hybrid() {
    std::cout << "Testing RetrievalIndex reindex/hybrid..." << std::endl;

    NeuronStore store(":memory:");
    store.open();

    add(store, "blink the led", "led blinking at 2 Hz");
    add(store, "read the sensor", "sensor says 21 degrees");

    RetrievalIndex index(store);
    assert(index.reindex() == 2);
    auto snap = index.snapshot();
    assert(snap && snap->size() == 2);

    // Inserted after the snapshot: invisible to BM25 until reindex
    NeuronId late = add(store, "LED ON", "done", 0.9f);

    HybridResult hybrid = index.hybrid_search("led on");
    assert(hybrid.bm25_results.size() == 2);
    for (const auto& r : hybrid.bm25_results) assert(r.neuron.id != late);
    assert(hybrid.context_matches.size() == 1);
    assert(hybrid.context_matches[0].id == late);

    assert(hybrid.combined.size() == 3);
    assert(hybrid.combined[0].source == HitSource::Bm25);
    assert(hybrid.combined[2].neuron.id == late);
    assert(hybrid.combined[2].source == HitSource::ContextHash);
    assert(near(hybrid.combined[2].score, 0.5f));

    // The old snapshot is untouched by the rebuild
    assert(index.reindex() == 3);
    assert(snap->size() == 2);

    // Now BM25 finds it and the context match is de-duplicated
    HybridResult fresh = index.hybrid_search("led on");
    assert(fresh.combined.size() == 3);
    size_t late_hits = 0;
    for (const auto& hit : fresh.combined) {
        if (hit.neuron.id == late) {
            ++late_hits;
            assert(hit.source == HitSource::Bm25);
        }
    }
    assert(late_hits == 1);

    // Window caps the snapshot to the newest neurons
    for (int i = 0; i < 6; ++i) add(store, "filler " + std::to_string(i), "text");
    assert(index.reindex(4) == 4);
    assert(index.snapshot()->neurons()[0].input_text == "filler 5");

    HybridResult capped = index.hybrid_search("filler text");
    assert(capped.combined.size() <= 5);

    std::cout << "  PASS" << std::endl;
}

void test_retrieval_concurrent_reindex() {
    std::cout << "Testing RetrievalIndex concurrent reindex..." << std::endl;

    NeuronStore store(":memory:");
    store.open();
    for (int i = 0; i < 50; ++i) {
        add(store, "motor speed " + std::to_string(i), "rpm " + std::to_string(i * 10));
    }

    RetrievalIndex index(store);
    index.reindex();

    std::thread rebuilder([&index] {
        for (int i = 0; i < 20; ++i) index.reindex();
    });
    size_t seen = 0;
    for (int i = 0; i < 20; ++i) {
        seen += index.retrieve("motor", 3).size();
    }
    rebuilder.join();

    assert(seen == 60);
    assert(index.snapshot()->size() == 50);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// RuleMiner
// ═══════════════════════════════════════════════════════════════════════════

void test_keyword_extractor() {
    std::cout << "Testing keyword extractor..." << std::endl;

    WhitespaceKeywordExtractor extractor;

    auto all = extractor.extract_keywords("Check the SERVO motor speed");
    assert(all.size() == 4);
    assert(all[0] == "check");
    assert(all[1] == "servo");

    KeywordOptions first_two;
    first_two.max_keywords = 2;
    assert(extractor.extract_keywords("Check the SERVO motor speed", first_two).size() == 2);

    KeywordOptions scan;
    scan.scan_words = 3;
    auto scanned = extractor.extract_keywords("the big servo motor speed", scan);
    assert(scanned.size() == 1);
    assert(scanned[0] == "servo");

    KeywordOptions long_words;
    long_words.min_chars = 5;
    auto longer = extractor.extract_keywords("idea honestly wiring", long_words);
    assert(longer.size() == 2);
    assert(longer[0] == "honestly");

    std::cout << "  PASS" << std::endl;
}

void test_miner_analyze() {
    std::cout << "Testing RuleMiner analyze..." << std::endl;

    NeuronStore store(":memory:");
    store.open();

    add(store, "check servo motor speed", "ok", 0.9f, 1, std::string("motors"));
    add(store, "servo servo servo", "ok", 0.5f, -1, std::string("motors"));
    add(store, "read sensor", "ok", 0.5f, 0, std::string("sensors"));

    RuleMiner miner(store);
    PatternGroups groups = miner.analyze();
    assert(groups.neurons == 3);

    assert(groups.by_skill.size() == 2);
    assert(groups.by_skill["motors"].size() == 2);
    assert(groups.by_skill["sensors"].size() == 1);

    assert(groups.by_mood["positive"].size() == 1);
    assert(groups.by_mood["negative"].size() == 1);
    assert(groups.by_mood["neutral"].size() == 1);

    // First three keywords only, one bucket entry per neuron
    assert(groups.by_keyword.count("check") == 1);
    assert(groups.by_keyword.count("motor") == 1);
    assert(groups.by_keyword.count("speed") == 0);
    assert(groups.by_keyword["servo"].size() == 2);
    assert(groups.by_keyword.count("read") == 1);

    assert(miner.analyze(1).neurons == 1);

    std::cout << "  PASS" << std::endl;
}

void test_miner_skill_scenario() {
    std::cout << "Testing RuleMiner skill confidence..." << std::endl;

    NeuronStore store(":memory:");
    store.open();

    add(store, "set pin 17 high", "done", 0.92f, 0, std::string("gpio"));
    add(store, "set pin 18 low", "done", 0.90f, 0, std::string("gpio"));
    add(store, "toggle pin 4", "done", 0.88f, 0, std::string("gpio"));
    add(store, "what is the weather", "no idea", 0.3f, 0, std::string("chat"));
    add(store, "tell me a joke", "no", 0.3f, 0, std::string("chat"));
    add(store, "sing a song", "la", 0.3f, 0, std::string("chat"));

    RuleMiner miner(store);
    EvolutionResult result = miner.auto_evolve(3);
    assert(result.neurons_analyzed == 6);

    const Rule* rule = find_trigger(result.rules, "skill_id:gpio");
    assert(rule != nullptr);
    assert(rule->rule_text == "Use high confidence for gpio tasks");
    assert(near(rule->confidence_threshold, 0.90f, 1e-3f));
    assert(rule->priority == 2);

    // Unconfident skills get no rule
    assert(!has_trigger(result.rules, "skill_id:chat"));

    assert(result.rules_saved == result.rules_generated);
    assert(store.rule_exists("Use high confidence for gpio tasks"));
    assert(result.message == "Generated " + std::to_string(result.rules_generated) +
                             " rules, saved " + std::to_string(result.rules_saved) + " new ones");
    // Exported to the default path in the working directory
    assert(result.snapshot_path == "instinct.json");
    assert(std::filesystem::exists("instinct.json"));
    std::filesystem::remove("instinct.json");

    // Fewer than min_occurrences members
    NeuronStore small(":memory:");
    small.open();
    add(small, "a", "b", 0.95f, 0, std::string("gpio"));
    add(small, "c", "d", 0.95f, 0, std::string("gpio"));
    RuleMiner small_miner(small);
    assert(!has_trigger(small_miner.generate_rules(3), "skill_id:gpio"));
    assert(has_trigger(small_miner.generate_rules(2), "skill_id:gpio"));

    std::cout << "  PASS" << std::endl;
}

void test_miner_negative_feedback() {
    std::cout << "Testing RuleMiner negative feedback..." << std::endl;

    NeuronStore store(":memory:");
    store.open();

    add(store, "q1", "honestly no idea", 0.5f, -1);
    add(store, "q2", "honestly bad idea", 0.5f, -1);
    add(store, "q3", "honestly some idea", 0.5f, -1);
    add(store, "q4", "honestly great", 0.5f, 1);

    RuleMiner miner(store);
    auto rules = miner.generate_rules();

    const Rule* avoid = find_trigger(rules, "avoid_word:honestly");
    assert(avoid != nullptr);
    assert(avoid->rule_text == "Avoid using 'honestly' in responses (negative feedback pattern)");
    assert(near(avoid->confidence_threshold, 0.3f));
    assert(avoid->priority == 3);

    // Four-letter words are too short
    assert(!has_trigger(rules, "avoid_word:idea"));

    // Two disliked answers are not a pattern
    NeuronStore few(":memory:");
    few.open();
    add(few, "q1", "honestly no", 0.5f, -1);
    add(few, "q2", "honestly no", 0.5f, -1);
    add(few, "q3", "honestly yes", 0.5f, 0);
    RuleMiner few_miner(few);
    assert(!has_trigger(few_miner.generate_rules(), "avoid_word:honestly"));

    std::cout << "  PASS" << std::endl;
}

void test_miner_confidence_patterns() {
    std::cout << "Testing RuleMiner confidence patterns..." << std::endl;

    NeuronStore store(":memory:");
    store.open();

    // High confidence
    add(store, "move the servo left", "ok", 0.9f);
    add(store, "servo angle check", "ok", 0.9f);
    add(store, "calibrate servo now", "ok", 0.9f);
    add(store, "list devices", "ok", 0.9f);
    add(store, "read sensor", "ok", 0.9f);

    // Low confidence
    add(store, "about quantum entanglement basics", "hmm", 0.2f);
    add(store, "quantum computing question", "hmm", 0.2f);
    add(store, "explain quantum tunneling", "hmm", 0.2f);
    add(store, "weather forecast", "hmm", 0.2f);
    add(store, "random thing", "hmm", 0.2f);

    RuleMiner miner(store);
    auto rules = miner.generate_rules();

    const Rule* servo = find_trigger(rules, "keyword:servo");
    assert(servo != nullptr);
    assert(servo->rule_text == "High confidence pattern detected for 'servo' queries");
    assert(near(servo->confidence_threshold, 0.8f));
    assert(servo->priority == 1);
    assert(!has_trigger(rules, "keyword:move"));

    const Rule* quantum = find_trigger(rules, "clarify:quantum");
    assert(quantum != nullptr);
    assert(quantum->rule_text == "Ask clarification for 'quantum' topics (low confidence pattern)");
    assert(near(quantum->confidence_threshold, 0.4f));
    assert(quantum->priority == 2);
    assert(!has_trigger(rules, "clarify:about"));

    assert(rules.size() == 2);

    // Topics only count within the first five words
    NeuronStore late(":memory:");
    late.open();
    for (int i = 0; i < 5; ++i) {
        add(late, "a b c d e quantum", "hmm", 0.2f);
    }
    RuleMiner late_miner(late);
    assert(!has_trigger(late_miner.generate_rules(), "clarify:quantum"));

    // Four confident neurons are not enough
    NeuronStore four(":memory:");
    four.open();
    for (int i = 0; i < 4; ++i) {
        add(four, "servo check", "ok", 0.9f);
    }
    RuleMiner four_miner(four);
    assert(!has_trigger(four_miner.generate_rules(), "keyword:servo"));

    std::cout << "  PASS" << std::endl;
}

void test_miner_dedup() {
    std::cout << "Testing RuleMiner de-duplication..." << std::endl;

    NeuronStore store(":memory:");
    store.open();

    for (int i = 0; i < 3; ++i) {
        add(store, "pin " + std::to_string(i), "done", 0.95f, 0, std::string("gpio"));
    }
    for (int i = 0; i < 5; ++i) {
        add(store, "servo step " + std::to_string(i), "done", 0.95f);
    }

    RuleMiner miner(store);
    auto first = miner.generate_rules();
    size_t saved_first = miner.save_rules(first);
    assert(!first.empty());
    assert(saved_first == first.size());

    auto second = miner.generate_rules();
    size_t saved_second = miner.save_rules(second);
    assert(second.size() == first.size());
    assert(saved_second == 0);
    assert(store.rules().size() == first.size());

    std::cout << "  PASS" << std::endl;
}

void test_miner_auto_evolve_threshold() {
    std::cout << "Testing RuleMiner auto_evolve threshold..." << std::endl;

    NeuronStore store(":memory:");
    store.open();
    add(store, "a", "b", 0.95f, 0, std::string("gpio"));
    add(store, "c", "d", 0.95f, 0, std::string("gpio"));
    add(store, "e", "f", 0.95f, 0, std::string("gpio"));

    EvolutionConfig config;
    config.snapshot_path = temp_path("never.json");
    RuleMiner miner(store, config);

    EvolutionResult result = miner.auto_evolve(50);
    assert(result.neurons_analyzed == 3);
    assert(result.rules_generated == 0);
    assert(result.rules_saved == 0);
    assert(result.message == "Not enough neurons (3 < 50)");
    assert(store.rules().empty());
    assert(!std::filesystem::exists(config.snapshot_path));

    std::cout << "  PASS" << std::endl;
}

void test_miner_snapshot_export() {
    std::cout << "Testing RuleMiner snapshot export..." << std::endl;

    NeuronStore store(":memory:");
    store.open();
    for (int i = 0; i < 3; ++i) {
        add(store, "pin " + std::to_string(i), "done", 0.95f, 0, std::string("gpio"));
    }

    EvolutionConfig config;
    config.snapshot_path = temp_path("snap/instinct.json");
    RuleMiner miner(store, config);

    EvolutionResult result = miner.auto_evolve(3);
    assert(result.snapshot_path == config.snapshot_path);
    assert(std::filesystem::exists(config.snapshot_path));

    std::ifstream in(config.snapshot_path);
    json doc = json::parse(in);
    assert(doc["rules_count"].get<size_t>() == result.rules_generated);
    assert(doc["generated_at"].is_string());
    assert(doc["rules"].size() == result.rules.size());
    const json& first = doc["rules"][0];
    assert(first["rule_text"] == "Use high confidence for gpio tasks");
    assert(first["trigger_pattern"] == "skill_id:gpio");
    assert(first["priority"] == 2);
    assert(first["enabled"] == true);
    assert(first.contains("confidence_threshold"));

    // Unwritable destination
    bool threw = false;
    try {
        miner.export_snapshot(result.rules, "/proc/evomemory/instinct.json");
    } catch (const StorageError&) {
        threw = true;
    }
    assert(threw);

    std::filesystem::remove_all(std::filesystem::path(config.snapshot_path).parent_path());

    std::cout << "  PASS" << std::endl;
}

// Tags every input with its first word, upper-cased
class FirstWordExtractor : public KeywordExtractor {
public:
    using KeywordExtractor::extract_keywords;

    std::vector<std::string> extract_keywords(
        const std::string& text, const KeywordOptions&) const override {
        auto words = split_words(text);
        if (words.empty()) return {};
        std::string first = words[0];
        for (auto& c : first) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        return {first};
    }
};

void test_miner_custom_extractor() {
    std::cout << "Testing RuleMiner custom extractor..." << std::endl;

    NeuronStore store(":memory:");
    store.open();
    for (int i = 0; i < 5; ++i) {
        add(store, "relay number " + std::to_string(i), "ok", 0.9f);
    }

    RuleMiner miner(store, EvolutionConfig{}, std::make_shared<FirstWordExtractor>());
    auto rules = miner.generate_rules();
    assert(has_trigger(rules, "keyword:RELAY"));
    assert(!has_trigger(rules, "keyword:relay"));

    miner.set_extractor(std::make_shared<WhitespaceKeywordExtractor>());
    assert(has_trigger(miner.generate_rules(), "keyword:relay"));

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Configuration & facade
// ═══════════════════════════════════════════════════════════════════════════

void test_config_loading() {
    std::cout << "Testing config loading..." << std::endl;

    std::string path = temp_path("config.json");
    {
        std::ofstream out(path);
        out << R"({
            "db_path": "/tmp/evomemory_custom/neurons.db",
            "reindex_every": 20,
            "scorer": { "clarification_threshold": 0.35 },
            "retrieval": { "bm25": { "k1": 1.2 }, "max_context_tokens": 500 },
            "evolution": { "analysis_window": 300 },
            "unknown_key": true
        })";
    }

    MemoryConfig config = load_config(path);
    assert(config.db_path == "/tmp/evomemory_custom/neurons.db");
    assert(config.reindex_every == 20);
    assert(near(config.scorer.clarification_threshold, 0.35f));
    assert(near(config.scorer.baseline, 0.5f));
    assert(near(config.retrieval.bm25.k1, 1.2f));
    assert(near(config.retrieval.bm25.b, 0.75f));
    assert(config.retrieval.max_context_tokens == 500);
    assert(config.retrieval.max_neurons == 1000);
    assert(config.evolution.analysis_window == 300);
    assert(config.evolution.min_occurrences == 3);

    MemoryConfig resolved = resolve_paths(config);
    assert(resolved.snapshot_path == "/tmp/evomemory_custom/instinct.json");
    assert(resolved.evolution.snapshot_path == resolved.snapshot_path);

    MemoryConfig memory_only;
    memory_only.db_path = ":memory:";
    MemoryConfig memory_resolved = resolve_paths(memory_only);
    assert(memory_resolved.snapshot_path == "instinct.json");
    assert(memory_resolved.evolution.snapshot_path == "instinct.json");

    // Wrong type
    {
        std::ofstream out(path);
        out << R"({ "reindex_every": "ten" })";
    }
    bool threw = false;
    try {
        load_config(path);
    } catch (const ValidationError&) {
        threw = true;
    }
    assert(threw);

    // Not JSON
    {
        std::ofstream out(path);
        out << "reindex_every = 10";
    }
    threw = false;
    try {
        load_config(path);
    } catch (const ValidationError&) {
        threw = true;
    }
    assert(threw);

    std::filesystem::remove(path);

    threw = false;
    try {
        load_config(path);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

void test_memory_facade() {
    std::cout << "Testing EvoMemory facade..." << std::endl;

    MemoryConfig config;
    config.db_path = ":memory:";
    config.reindex_every = 3;
    EvoMemory memory(config);
    memory.open();

    Interaction first = memory.remember("set the thermostat", "thermostat set to twenty degrees");
    assert(first.id > 0);
    assert(near(first.confidence, 0.5f));
    assert(first.label == "medium");
    assert(!first.ask_clarification);

    RememberOptions options;
    options.skill_id = "home";
    options.idea = "user wants the door open";
    Interaction second = memory.remember("open the door", "no", options);
    assert(near(second.confidence, 0.3f));
    assert(second.label == "low");
    assert(second.ask_clarification);
    assert(second.reasoning == "output too short");
    assert(memory.get(second.id)->skill_id == std::string("home"));
    assert(!memory.index().indexed());

    // Third insert triggers the rebuild
    memory.remember("turn on lights", "lights are on now");
    assert(memory.index().indexed());
    assert(memory.index().snapshot()->size() == 3);

    bool updated = memory.feedback(first.id, 1);
    assert(updated);
    assert(memory.get(first.id)->mood == Mood::Positive);

    // Injected neurons count as accessed
    std::string context = memory.context_for("thermostat");
    assert(!context.empty());
    assert(memory.get(first.id)->access_count == 1);

    std::string nothing = memory.context_for("zebra");
    assert(nothing.empty());
    assert(memory.get(first.id)->access_count == 1);

    assert(!memory.retrieve("thermostat", 1).empty());
    assert(!memory.hybrid_search("open the door").context_matches.empty());

    StoreStats s = memory.stats();
    assert(s.neurons == 3);

    EvolutionResult evo = memory.evolve();
    assert(evo.rules_generated == 0);

    assert(memory.prune() == 0);

    memory.close();

    std::cout << "  PASS" << std::endl;
}

void test_memory_facade_on_disk() {
    std::cout << "Testing EvoMemory on disk..." << std::endl;

    std::string dir = temp_path("facade");
    std::filesystem::remove_all(dir);

    MemoryConfig config;
    config.db_path = dir + "/neurons.db";
    EvoMemory memory(config);
    memory.open();
    assert(memory.config().snapshot_path == dir + "/instinct.json");

    RememberOptions gpio;
    gpio.skill_id = "gpio";
    for (int i = 0; i < 3; ++i) {
        memory.remember("set pin " + std::to_string(i),
                        "Certamente! Il pin " + std::to_string(i) +
                        " è sicuramente configurato come uscita digitale.", gpio);
    }

    EvolutionResult evo = memory.evolve(3);
    assert(has_trigger(evo.rules, "skill_id:gpio"));
    assert(std::filesystem::exists(dir + "/instinct.json"));

    memory.close();
    std::filesystem::remove_all(dir);

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== EvoMemory Tests ===" << std::endl;
    std::cout << "version = " << EVOMEMORY_VERSION << std::endl;
    std::cout << std::endl;

    test_context_hash();
    test_tokenize();
    test_safe_save_concurrent();

    test_scorer_bounds();
    test_scorer_uncertain_italian();
    test_scorer_certain_italian();
    test_scorer_adjustments();
    test_scorer_generation_stats();
    test_scorer_labels_and_config();

    std::cout << std::endl;
    std::cout << "=== Storage Tests ===" << std::endl;
    test_store_save_get();
    test_store_validation();
    test_store_recent_order();
    test_store_similar_search();
    test_store_feedback_mood();
    test_store_prune();
    test_store_access_and_stats();
    test_store_rules();
    test_store_skills();
    test_store_persistence();
    test_store_errors();
    test_store_concurrent_saves();

    std::cout << std::endl;
    std::cout << "=== Retrieval Tests ===" << std::endl;
    test_retrieval_ranking();
    test_retrieval_bm25_formula();
    test_retrieval_led_scenario();
    test_retrieval_boosts();
    test_retrieval_context_below_threshold();
    test_retrieval_context_format();
    test_retrieval_reindex_and_hybrid();
    test_retrieval_concurrent_reindex();

    std::cout << std::endl;
    std::cout << "=== Evolution Tests ===" << std::endl;
    test_keyword_extractor();
    test_miner_analyze();
    test_miner_skill_scenario();
    test_miner_negative_feedback();
    test_miner_confidence_patterns();
    test_miner_dedup();
    test_miner_auto_evolve_threshold();
    test_miner_snapshot_export();
    test_miner_custom_extractor();

    test_config_loading();
    test_memory_facade();
    test_memory_facade_on_disk();

    std::cout << std::endl;
    std::cout << "=== All tests passed! ===" << std::endl;
    return 0;
}
