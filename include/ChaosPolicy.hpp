#pragma once

#include <cstdint>
#include <optional>
#include <random>
#include <string>

#include "value.hpp"

// Owned, injectable random source. Every chaos decision draws from here.
class ChaosRng {
   public:
    explicit ChaosRng(std::optional<uint64_t> seed = std::nullopt);

    uint64_t seed() const { return seed_; }
    uint64_t draws() const { return draws_; }

    // uniform in [0, 1)
    double next_unit();
    // uniform in [0, n); n must be > 0
    size_t next_index(size_t n);
    bool next_bool();

   private:
    uint64_t seed_;
    uint64_t draws_ = 0;
    std::mt19937_64 engine_;
};

enum class ArithOp {
    Add,
    Subtract,
    Multiply,
    Divide
};

const char* arith_op_name(ArithOp op);

enum class BooleanFlip {
    Opposite,
    Stringified,
    Numeric,
    Unchanged
};

enum class Settlement {
    Resolve,
    Stay,
    Abandon
};

// What mischief does to a user function call.
enum class CallMischief {
    None,
    ReturnNull,
    TaskFailed,
    CoffeeBreak
};

struct ChaosOptions {
    bool mischief = false;
    bool trace = false;
};

// Fixed probability table.
namespace chaos_odds {
constexpr double randomize_expression = 0.25;

constexpr double flip_opposite = 0.30;
constexpr double flip_stringified = 0.20;
constexpr double flip_numeric = 0.20;

constexpr double add_becomes_subtract = 0.80;
constexpr double multiply_becomes_divide = 0.80;

constexpr double random_container_index = 0.75;
constexpr double random_record_field = 0.50;
constexpr double surface_type_mismatch = 0.50;

constexpr double print_browser_error = 0.10;
constexpr double teapot = 0.01;

constexpr double promise_resolve = 0.30;
constexpr double promise_abandon = 0.05;
constexpr double promise_mind_change = 0.20;
constexpr double promise_flip = 0.50;

// mischief mode
constexpr double mischief_teapot_at_start = 0.10;
constexpr double mischief_party_number = 0.10;
constexpr double mischief_identifier_vacation = 0.15;
constexpr double mischief_lost_binding = 0.20;
constexpr double mischief_loop_failure = 0.25;
constexpr double mischief_creative_else = 0.15;
constexpr double mischief_perfectly_wrong = 0.20;
constexpr double mischief_style_points = 0.30;
constexpr double mischief_call_null = 0.30;
constexpr double mischief_call_task_failed = 0.60;  // cumulative; the rest is a coffee break

constexpr double save_plain = 0.30;
constexpr double save_creative = 0.60;  // cumulative
}  // namespace chaos_odds

class ChaosPolicy {
   public:
    ChaosPolicy(ChaosRng& rng, ChaosOptions options = ChaosOptions());

    // 25%: the value is replaced by a coin flip.
    Value maybe_randomize_expression_result(const Value& v);

    // Second, independent draw on Boolean results.
    Value maybe_flip_boolean(bool b);
    BooleanFlip draw_boolean_flip();

    // add -> subtract | multiply, multiply -> divide | add
    ArithOp pick_arith_alt(ArithOp requested);

    // nullopt when `requested` is outside [0, len); no draw is made then.
    std::optional<size_t> pick_container_index(size_t len, int64_t requested);

    // nullopt for an empty record. Otherwise the requested key or a random existing one.
    std::optional<std::string> pick_field(const RecordValue& record, const std::string& requested);

    bool invert_branch_always() const { return true; }
    int loop_once() const { return 1; }

    bool surface_type_mismatch();
    bool random_boolean();
    bool browser_error_on_print();
    bool teapot();

    Settlement settle_pending();
    bool mind_change_at_creation();
    bool flip_now();

    // mischief hooks; all false without drawing when mischief is off
    bool mischief() const { return options_.mischief; }
    bool mischief_teapot_at_start();
    bool mischief_party_number();
    bool mischief_identifier_vacation();
    bool mischief_lost_binding();
    bool mischief_loop_failure();
    bool mischief_creative_else();
    bool mischief_perfectly_wrong();
    bool mischief_style_points();
    // None without drawing when mischief is off.
    CallMischief mischief_function_call();

    // One of the three save failure messages.
    std::string pick_save_message();

    void trace(const std::string& point, const std::string& outcome) const;
    bool tracing() const { return options_.trace; }

    ChaosRng& rng() { return rng_; }

   private:
    ChaosRng& rng_;
    ChaosOptions options_;

    bool mischief_draw(double odds, const char* point);
};

// Party emoji text that replaces a number literal in mischief mode.
std::string party_text(double n);
