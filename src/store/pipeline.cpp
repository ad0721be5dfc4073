/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file pipeline.cpp
 * @brief Implementation of the aggregation stages and expression evaluator.
 */

#include "docgate/store/pipeline.hpp"

#include "docgate/infra/string.hpp"
#include "docgate/store/field_path.hpp"
#include "docgate/store/matcher.hpp"
#include "docgate/store/store.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <map>
#include <random>

namespace docgate::store {

namespace {

using Operands = std::vector<std::optional<bson::Value>>;

struct ValueLess {
    bool operator()(const bson::Value& a, const bson::Value& b) const
    {
        return bson::compare(a, b) < 0;
    }
};

void tick(StageContext& ctx)
{
    if (ctx.deadline) {
        ctx.deadline->check();
    }
}

std::int64_t integer_arg(const bson::Value& value, const std::string& stage)
{
    if (value.is_int64()) {
        return value.as_int64();
    }
    if (value.is_double() && std::floor(value.as_double()) == value.as_double() &&
        std::fabs(value.as_double()) < 9.0e15) {
        return static_cast<std::int64_t>(value.as_double());
    }
    throw StoreError(stage + " requires an integer argument");
}

const std::string& string_field(const bson::Document& spec, const std::string& key,
                                const std::string& stage)
{
    const bson::Value* value = spec.find(key);
    if (!value || !value->is_string()) {
        throw StoreError(stage + " requires a string '" + key + "' field");
    }
    return value->as_string();
}

/// Collection and output field names: non-empty, no `$` prefix, no dots.
bool plain_name(const std::string& name)
{
    return !name.empty() && name[0] != '$' && name.find('.') == std::string::npos;
}

// ============================================================================
//  Expressions
// ============================================================================

Operands operands_of(const bson::Value& arg, const bson::Document& doc)
{
    Operands out;
    if (arg.is_array()) {
        for (const auto& item : arg.as_array()) {
            out.push_back(Pipeline::evaluate(item, doc));
        }
    } else {
        out.push_back(Pipeline::evaluate(arg, doc));
    }
    return out;
}

bson::Value arithmetic(const std::string& op, const Operands& args)
{
    if (args.empty()) {
        throw StoreError(op + " needs at least one argument");
    }
    if ((op == "$subtract" || op == "$divide") && args.size() != 2) {
        throw StoreError(op + " needs exactly two arguments");
    }

    bool all_int = op != "$divide";
    for (const auto& arg : args) {
        if (!arg || arg->is_null()) {
            return bson::Null{};
        }
        if (!arg->is_number()) {
            throw StoreError(op + " only supports numeric types");
        }
        all_int = all_int && arg->is_int64();
    }

    if (op == "$divide") {
        if (args[1]->as_number() == 0.0) {
            throw StoreError("can't $divide by zero");
        }
        return args[0]->as_number() / args[1]->as_number();
    }

    // Track the running result both exactly and as a double; fall back to the double
    // once any partial result leaves the exactly-representable range.
    double real = args[0]->as_number();
    std::int64_t exact = all_int ? args[0]->as_int64() : 0;
    for (std::size_t i = 1; i < args.size(); ++i) {
        const double rhs = args[i]->as_number();
        if (op == "$add") {
            real += rhs;
        } else if (op == "$subtract") {
            real -= rhs;
        } else {
            real *= rhs;
        }
        if (all_int && std::fabs(real) < 9.0e15) {
            const std::int64_t r = args[i]->as_int64();
            exact = op == "$add" ? exact + r : op == "$subtract" ? exact - r : exact * r;
        } else {
            all_int = false;
        }
    }
    if (all_int) {
        return exact;
    }
    return real;
}

std::optional<bson::Value> apply_operator(const std::string& op, const bson::Value& arg,
                                          const bson::Document& doc)
{
    if (op == "$literal") {
        return arg;
    }

    const Operands args = operands_of(arg, doc);

    if (op == "$type") {
        if (args.size() != 1) {
            throw StoreError("$type takes exactly one argument");
        }
        return bson::Value(args[0] ? bson::type_name(args[0]->type()) : "missing");
    }
    if (op == "$add" || op == "$subtract" || op == "$multiply" || op == "$divide") {
        return arithmetic(op, args);
    }
    if (op == "$concat") {
        std::string out;
        for (const auto& part : args) {
            if (!part || part->is_null()) {
                return bson::Value(bson::Null{});
            }
            if (!part->is_string()) {
                throw StoreError("$concat only supports strings");
            }
            out += part->as_string();
        }
        return bson::Value(out);
    }
    if (op == "$size") {
        if (args.size() != 1 || !args[0] || !args[0]->is_array()) {
            throw StoreError("The argument to $size must be an array");
        }
        return bson::Value(static_cast<std::int64_t>(args[0]->as_array().size()));
    }
    if (op == "$ifNull") {
        if (args.size() != 2) {
            throw StoreError("$ifNull needs exactly two arguments");
        }
        if (args[0] && !args[0]->is_null()) {
            return args[0];
        }
        return args[1];
    }
    if (op == "$toUpper" || op == "$toLower") {
        if (args.size() != 1) {
            throw StoreError(op + " takes exactly one argument");
        }
        if (!args[0] || args[0]->is_null()) {
            return bson::Value("");
        }
        if (!args[0]->is_string()) {
            throw StoreError(op + " only supports strings");
        }
        std::string s = args[0]->as_string();
        if (op == "$toLower") {
            return bson::Value(infra::String::to_lower(s));
        }
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return bson::Value(s);
    }
    throw StoreError("Unsupported expression operator: " + op);
}

// ============================================================================
//  $group
// ============================================================================

struct Accumulator {
    std::string field;
    std::string op;
    bson::Value expr;
};

struct AccumulatorState {
    std::int64_t int_sum = 0;
    double double_sum = 0.0;
    bool saw_double = false;
    std::int64_t count = 0;
    std::optional<bson::Value> value;
    bson::Array pushed;
};

struct Group {
    bson::Value key;
    std::vector<AccumulatorState> states;
};

void accumulate(const Accumulator& acc, AccumulatorState& state,
                const std::optional<bson::Value>& input)
{
    if (acc.op == "$sum" || acc.op == "$avg") {
        if (input && input->is_number()) {
            if (input->is_int64()) {
                state.int_sum += input->as_int64();
            } else {
                state.double_sum += input->as_double();
                state.saw_double = true;
            }
            state.count++;
        }
    } else if (acc.op == "$min" || acc.op == "$max") {
        if (input && !input->is_null()) {
            const bool better =
                !state.value || (acc.op == "$min" ? bson::compare(*input, *state.value) < 0
                                                  : bson::compare(*input, *state.value) > 0);
            if (better) {
                state.value = input;
            }
        }
    } else if (acc.op == "$first") {
        if (state.count++ == 0) {
            state.value = input ? *input : bson::Value(bson::Null{});
        }
    } else if (acc.op == "$last") {
        state.value = input ? *input : bson::Value(bson::Null{});
    } else if (acc.op == "$push") {
        if (input) {
            state.pushed.push_back(*input);
        }
    }
}

bson::Value finish(const Accumulator& acc, const AccumulatorState& state)
{
    if (acc.op == "$sum") {
        if (state.saw_double) {
            return static_cast<double>(state.int_sum) + state.double_sum;
        }
        return state.int_sum;
    }
    if (acc.op == "$avg") {
        if (state.count == 0) {
            return bson::Null{};
        }
        return (static_cast<double>(state.int_sum) + state.double_sum) /
               static_cast<double>(state.count);
    }
    if (acc.op == "$push") {
        return state.pushed;
    }
    return state.value ? *state.value : bson::Value(bson::Null{});
}

std::vector<bson::Document> group(const std::vector<bson::Document>& docs,
                                  const bson::Document& spec, StageContext& ctx)
{
    const bson::Value* key_expr = spec.find("_id");
    if (!key_expr) {
        throw StoreError("a group specification must include an _id");
    }

    std::vector<Accumulator> accumulators;
    for (const auto& [field, body] : spec) {
        if (field == "_id") {
            continue;
        }
        if (!body.is_document() || body.as_document().size() != 1) {
            throw StoreError("The field '" + field + "' must be an accumulator object");
        }
        const auto& [op, expr] = body.as_document().front();
        if (op != "$sum" && op != "$avg" && op != "$min" && op != "$max" && op != "$first" &&
            op != "$last" && op != "$push") {
            throw StoreError("Unsupported accumulator: " + op);
        }
        accumulators.push_back({field, op, expr});
    }

    std::vector<Group> groups;
    std::map<bson::Value, std::size_t, ValueLess> index;
    for (const auto& doc : docs) {
        tick(ctx);
        const auto key = Pipeline::evaluate(*key_expr, doc);
        const bson::Value k = key ? *key : bson::Value(bson::Null{});

        auto it = index.find(k);
        if (it == index.end()) {
            it = index.emplace(k, groups.size()).first;
            groups.push_back({k, std::vector<AccumulatorState>(accumulators.size())});
        }
        Group& g = groups[it->second];
        for (std::size_t i = 0; i < accumulators.size(); ++i) {
            accumulate(accumulators[i], g.states[i],
                       Pipeline::evaluate(accumulators[i].expr, doc));
        }
    }

    std::vector<bson::Document> out;
    out.reserve(groups.size());
    for (const auto& g : groups) {
        bson::Document row;
        row.append("_id", g.key);
        for (std::size_t i = 0; i < accumulators.size(); ++i) {
            row.append(accumulators[i].field, finish(accumulators[i], g.states[i]));
        }
        out.push_back(std::move(row));
    }
    return out;
}

// ============================================================================
//  Other stages
// ============================================================================

std::vector<bson::Document> unwind(const std::vector<bson::Document>& docs,
                                   const bson::Value& arg, StageContext& ctx)
{
    std::string path;
    std::string index_field;
    bool preserve = false;

    if (arg.is_string()) {
        path = arg.as_string();
    } else if (arg.is_document()) {
        path = string_field(arg.as_document(), "path", "$unwind");
        if (const bson::Value* p = arg.as_document().find("preserveNullAndEmptyArrays")) {
            preserve = p->truthy();
        }
        if (const bson::Value* i = arg.as_document().find("includeArrayIndex")) {
            if (!i->is_string() || !plain_name(i->as_string())) {
                throw StoreError("includeArrayIndex must be a plain field name");
            }
            index_field = i->as_string();
        }
    } else {
        throw StoreError("$unwind requires a path string or an options object");
    }
    if (path.size() < 2 || path[0] != '$') {
        throw StoreError("$unwind path must be prefixed by '$'");
    }
    const std::string field = path.substr(1);

    std::vector<bson::Document> out;
    for (const auto& doc : docs) {
        tick(ctx);
        const bson::Value* value = FieldPath::get(doc, field);

        if (value && value->is_array() && !value->as_array().empty()) {
            const bson::Array items = value->as_array();
            for (std::size_t i = 0; i < items.size(); ++i) {
                bson::Document row = doc;
                FieldPath::set(row, field, items[i]);
                if (!index_field.empty()) {
                    row.set(index_field, static_cast<std::int64_t>(i));
                }
                out.push_back(std::move(row));
            }
        } else if (value && !value->is_array() && !value->is_null()) {
            bson::Document row = doc;
            if (!index_field.empty()) {
                row.set(index_field, bson::Null{});
            }
            out.push_back(std::move(row));
        } else if (preserve) {
            bson::Document row = doc;
            if (value && value->is_array()) {
                FieldPath::erase(row, field);
            }
            if (!index_field.empty()) {
                row.set(index_field, bson::Null{});
            }
            out.push_back(std::move(row));
        }
    }
    return out;
}

std::vector<bson::Document> lookup(std::vector<bson::Document> docs, const bson::Value& arg,
                                   StageContext& ctx)
{
    if (!arg.is_document()) {
        throw StoreError("$lookup requires an object");
    }
    const auto& spec = arg.as_document();
    const std::string& from = string_field(spec, "from", "$lookup");
    const std::string& local_field = string_field(spec, "localField", "$lookup");
    const std::string& foreign_field = string_field(spec, "foreignField", "$lookup");
    const std::string& as = string_field(spec, "as", "$lookup");
    if (!plain_name(from)) {
        throw StoreError("$lookup 'from' must be a collection name");
    }

    const std::vector<bson::Document> foreign = ctx.load_collection(from);

    for (auto& doc : docs) {
        bson::Array locals;
        const bson::Value* local = FieldPath::get(doc, local_field);
        if (!local) {
            locals.push_back(bson::Null{});
        } else if (local->is_array()) {
            locals = local->as_array();
        } else {
            locals.push_back(*local);
        }

        const bson::Document filter{{foreign_field, bson::Document{{"$in", locals}}}};
        bson::Array joined;
        for (const auto& candidate : foreign) {
            tick(ctx);
            if (Matcher::matches(candidate, filter)) {
                joined.push_back(candidate);
            }
        }
        FieldPath::set(doc, as, std::move(joined));
    }
    return docs;
}

std::vector<bson::Document> sample(std::vector<bson::Document> docs, const bson::Value& arg)
{
    const bson::Value* size = arg.is_document() ? arg.as_document().find("size") : nullptr;
    if (!size) {
        throw StoreError("$sample requires a 'size' field");
    }
    const std::int64_t n = integer_arg(*size, "$sample");
    if (n < 0) {
        throw StoreError("$sample size must be non-negative");
    }

    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::shuffle(docs.begin(), docs.end(), rng);
    if (static_cast<std::size_t>(n) < docs.size()) {
        docs.resize(static_cast<std::size_t>(n));
    }
    return docs;
}

std::vector<bson::Document> facet(const std::vector<bson::Document>& docs,
                                  const bson::Value& arg, StageContext& ctx)
{
    if (!arg.is_document() || arg.as_document().empty()) {
        throw StoreError("$facet requires a non-empty object");
    }

    bson::Document row;
    for (const auto& [name, sub] : arg.as_document()) {
        if (!sub.is_array()) {
            throw StoreError("$facet '" + name + "' must be a pipeline array");
        }
        for (const auto& stage : sub.as_array()) {
            if (stage.is_document() && stage.as_document().size() == 1) {
                const std::string& inner = stage.as_document().front().first;
                if (inner == "$out" || inner == "$merge" || inner == "$facet") {
                    throw StoreError(inner + " is not allowed inside $facet");
                }
            }
        }
        bson::Array results;
        for (auto& doc : Pipeline::run(docs, sub.as_array(), ctx)) {
            results.push_back(std::move(doc));
        }
        row.append(name, std::move(results));
    }
    return {row};
}

} // namespace

// ============================================================================
//  Pipeline
// ============================================================================

std::optional<bson::Value> Pipeline::evaluate(const bson::Value& expr, const bson::Document& doc)
{
    if (expr.is_string()) {
        const std::string& s = expr.as_string();
        if (s.rfind("$$", 0) == 0) {
            if (s == "$$ROOT" || s == "$$CURRENT") {
                return bson::Value(doc);
            }
            throw StoreError("Unsupported variable: " + s);
        }
        if (!s.empty() && s[0] == '$') {
            const bson::Value* value = FieldPath::get(doc, s.substr(1));
            if (!value) {
                return std::nullopt;
            }
            return *value;
        }
        return expr;
    }

    if (expr.is_array()) {
        bson::Array out;
        for (const auto& item : expr.as_array()) {
            auto value = evaluate(item, doc);
            out.push_back(value ? *value : bson::Value(bson::Null{}));
        }
        return bson::Value(std::move(out));
    }

    if (expr.is_document()) {
        const auto& spec = expr.as_document();
        if (spec.size() == 1 && !spec.front().first.empty() && spec.front().first[0] == '$') {
            return apply_operator(spec.front().first, spec.front().second, doc);
        }
        bson::Document out;
        for (const auto& [key, sub] : spec) {
            if (auto value = evaluate(sub, doc)) {
                out.append(key, std::move(*value));
            }
        }
        return bson::Value(std::move(out));
    }

    return expr;
}

bson::Document Pipeline::project(const bson::Document& doc, const bson::Document& spec)
{
    bool include_id = true;
    bool inclusion = false;
    bool exclusion = false;
    std::size_t other_fields = 0;

    for (const auto& [field, value] : spec) {
        const bool flag = value.is_bool() || value.is_number();
        if (field == "_id") {
            if (flag && !value.truthy()) {
                include_id = false;
            }
            continue;
        }
        other_fields++;
        if (flag && !value.truthy()) {
            exclusion = true;
        } else {
            inclusion = true;
        }
    }
    if (inclusion && exclusion) {
        throw StoreError("Cannot mix inclusion and exclusion in a projection");
    }
    if (other_fields == 0 && include_id) {
        const bson::Value* id = spec.find("_id");
        inclusion = id != nullptr;
    }

    if (!inclusion) {
        bson::Document out = doc;
        for (const auto& [field, value] : spec) {
            if ((value.is_bool() || value.is_number()) && !value.truthy()) {
                FieldPath::erase(out, field);
            }
        }
        return out;
    }

    bson::Document out;
    const bson::Value* id_spec = spec.find("_id");
    if (id_spec && !(id_spec->is_bool() || id_spec->is_number())) {
        if (auto value = evaluate(*id_spec, doc)) {
            out.append("_id", std::move(*value));
        }
    } else if (include_id) {
        if (const bson::Value* id = doc.find("_id")) {
            out.append("_id", *id);
        }
    }

    for (const auto& [field, value] : spec) {
        if (field == "_id") {
            continue;
        }
        if (value.is_bool() || value.is_number()) {
            if (const bson::Value* src = FieldPath::get(doc, field)) {
                FieldPath::set(out, field, *src);
            }
        } else if (auto computed = evaluate(value, doc)) {
            FieldPath::set(out, field, std::move(*computed));
        }
    }
    return out;
}

void Pipeline::sort(std::vector<bson::Document>& docs, const bson::Document& spec)
{
    std::vector<std::pair<std::string, int>> keys;
    for (const auto& [field, direction] : spec) {
        if (!direction.is_number() ||
            (direction.as_number() != 1.0 && direction.as_number() != -1.0)) {
            throw StoreError("sort key ordering must be 1 (for ascending) or -1 (for descending)");
        }
        keys.emplace_back(field, direction.as_number() > 0 ? 1 : -1);
    }

    const bson::Value missing = bson::Null{};
    std::stable_sort(docs.begin(), docs.end(),
                     [&keys, &missing](const bson::Document& a, const bson::Document& b) {
                         for (const auto& [field, direction] : keys) {
                             const bson::Value* va = FieldPath::get(a, field);
                             const bson::Value* vb = FieldPath::get(b, field);
                             const int c = bson::compare(va ? *va : missing, vb ? *vb : missing);
                             if (c != 0) {
                                 return direction > 0 ? c < 0 : c > 0;
                             }
                         }
                         return false;
                     });
}

bool Pipeline::writes(const bson::Array& stages)
{
    for (const auto& stage : stages) {
        if (stage.is_document() && stage.as_document().contains("$out")) {
            return true;
        }
    }
    return false;
}

std::vector<bson::Document> Pipeline::run(std::vector<bson::Document> docs,
                                          const bson::Array& stages, StageContext& ctx)
{
    for (std::size_t i = 0; i < stages.size(); ++i) {
        const bson::Value& stage = stages[i];
        if (!stage.is_document() || stage.as_document().size() != 1) {
            throw StoreError("A pipeline stage specification object must contain exactly one "
                             "field");
        }
        const auto& [name, arg] = stage.as_document().front();

        if (name == "$match") {
            if (!arg.is_document()) {
                throw StoreError("the match filter must be an expression in an object");
            }
            std::vector<bson::Document> kept;
            for (auto& doc : docs) {
                tick(ctx);
                if (Matcher::matches(doc, arg.as_document())) {
                    kept.push_back(std::move(doc));
                }
            }
            docs = std::move(kept);
        } else if (name == "$project") {
            if (!arg.is_document() || arg.as_document().empty()) {
                throw StoreError("$project requires a non-empty object");
            }
            for (auto& doc : docs) {
                tick(ctx);
                doc = project(doc, arg.as_document());
            }
        } else if (name == "$addFields") {
            if (!arg.is_document()) {
                throw StoreError("$addFields requires an object");
            }
            for (auto& doc : docs) {
                tick(ctx);
                bson::Document row = doc;
                for (const auto& [field, expr] : arg.as_document()) {
                    if (auto value = evaluate(expr, doc)) {
                        FieldPath::set(row, field, std::move(*value));
                    }
                }
                doc = std::move(row);
            }
        } else if (name == "$sort") {
            if (!arg.is_document() || arg.as_document().empty()) {
                throw StoreError("$sort stage must have at least one sort key");
            }
            sort(docs, arg.as_document());
        } else if (name == "$limit") {
            const std::int64_t n = integer_arg(arg, "$limit");
            if (n <= 0) {
                throw StoreError("the limit must be positive");
            }
            if (static_cast<std::size_t>(n) < docs.size()) {
                docs.resize(static_cast<std::size_t>(n));
            }
        } else if (name == "$skip") {
            const std::int64_t n = integer_arg(arg, "$skip");
            if (n < 0) {
                throw StoreError("$skip must be non-negative");
            }
            const auto drop = std::min(docs.size(), static_cast<std::size_t>(n));
            docs.erase(docs.begin(), docs.begin() + static_cast<std::ptrdiff_t>(drop));
        } else if (name == "$count") {
            if (!arg.is_string() || !plain_name(arg.as_string())) {
                throw StoreError("$count requires a plain field name");
            }
            const auto n = static_cast<std::int64_t>(docs.size());
            docs.clear();
            if (n > 0) {
                docs.push_back(bson::Document{{arg.as_string(), n}});
            }
        } else if (name == "$unwind") {
            docs = unwind(docs, arg, ctx);
        } else if (name == "$group") {
            if (!arg.is_document()) {
                throw StoreError("a group's fields must be specified in an object");
            }
            docs = group(docs, arg.as_document(), ctx);
        } else if (name == "$sample") {
            docs = sample(std::move(docs), arg);
        } else if (name == "$facet") {
            docs = facet(docs, arg, ctx);
        } else if (name == "$lookup") {
            docs = lookup(std::move(docs), arg, ctx);
        } else if (name == "$out") {
            if (i + 1 != stages.size()) {
                throw StoreError("$out can only be the final stage in the pipeline");
            }
            if (!arg.is_string() || !plain_name(arg.as_string())) {
                throw StoreError("$out requires a collection name");
            }
            ctx.replace_collection(arg.as_string(), std::move(docs));
            docs.clear();
        } else if (name == "$bucket" || name == "$merge" || name == "$geoNear" ||
                   name == "$graphLookup" || name == "$function" || name == "$accumulator" ||
                   name == "$expr") {
            throw StoreError("Aggregation stage " + name + " is not supported by this store");
        } else {
            throw StoreError("Unrecognized pipeline stage name: " + name);
        }
    }
    return docs;
}

} // namespace docgate::store
