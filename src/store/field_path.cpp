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
 * @file field_path.cpp
 * @brief Implementation of dotted-path access.
 */

#include "docgate/store/field_path.hpp"

#include <cctype>

namespace docgate::store {

namespace {

/// Array index segments are capped at six digits so a write cannot pad an array without
/// bound.
bool as_index(const std::string& segment, std::size_t& index)
{
    if (segment.empty() || segment.size() > 6) {
        return false;
    }
    for (char c : segment) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    index = static_cast<std::size_t>(std::stoul(segment));
    return true;
}

const bson::Value* child(const bson::Value& node, const std::string& segment)
{
    if (node.is_document()) {
        return node.as_document().find(segment);
    }
    std::size_t index = 0;
    if (node.is_array() && as_index(segment, index) && index < node.as_array().size()) {
        return &node.as_array()[index];
    }
    return nullptr;
}

void collect(const bson::Value& node, const std::vector<std::string>& segments, std::size_t idx,
             std::vector<const bson::Value*>& out)
{
    if (idx == segments.size()) {
        out.push_back(&node);
        return;
    }

    if (node.is_document()) {
        if (const bson::Value* next = node.as_document().find(segments[idx])) {
            collect(*next, segments, idx + 1, out);
        }
    } else if (node.is_array()) {
        const auto& items = node.as_array();
        std::size_t index = 0;
        if (as_index(segments[idx], index) && index < items.size()) {
            collect(items[index], segments, idx + 1, out);
        }
        for (const auto& item : items) {
            if (item.is_document()) {
                collect(item, segments, idx, out);
            }
        }
    }
}

bool set_in(bson::Document& doc, const std::vector<std::string>& segments, std::size_t idx,
            bson::Value value);

bool set_in_value(bson::Value& node, const std::vector<std::string>& segments, std::size_t idx,
                  bson::Value value)
{
    if (node.is_document()) {
        return set_in(node.as_document(), segments, idx, std::move(value));
    }

    std::size_t index = 0;
    if (node.is_array() && as_index(segments[idx], index)) {
        auto& items = node.as_array();
        if (index >= items.size()) {
            items.resize(index + 1);
        }
        if (idx + 1 == segments.size()) {
            items[index] = std::move(value);
            return true;
        }
        if (items[index].is_null()) {
            items[index] = bson::Document{};
        }
        return set_in_value(items[index], segments, idx + 1, std::move(value));
    }
    return false;
}

bool set_in(bson::Document& doc, const std::vector<std::string>& segments, std::size_t idx,
            bson::Value value)
{
    const std::string& segment = segments[idx];
    if (idx + 1 == segments.size()) {
        doc.set(segment, std::move(value));
        return true;
    }

    bson::Value* next = doc.find(segment);
    if (!next) {
        doc.set(segment, bson::Document{});
        next = doc.find(segment);
    }
    return set_in_value(*next, segments, idx + 1, std::move(value));
}

} // namespace

std::vector<std::string> FieldPath::split(const std::string& path)
{
    std::vector<std::string> segments;
    std::size_t start = 0;
    while (true) {
        const std::size_t dot = path.find('.', start);
        if (dot == std::string::npos) {
            segments.push_back(path.substr(start));
            break;
        }
        segments.push_back(path.substr(start, dot - start));
        start = dot + 1;
    }
    return segments;
}

const bson::Value* FieldPath::get(const bson::Document& doc, const std::string& path)
{
    const auto segments = split(path);
    const bson::Value* current = doc.find(segments[0]);
    for (std::size_t i = 1; current && i < segments.size(); ++i) {
        current = child(*current, segments[i]);
    }
    return current;
}

std::vector<const bson::Value*> FieldPath::resolve(const bson::Document& doc,
                                                   const std::string& path)
{
    const auto segments = split(path);
    std::vector<const bson::Value*> out;
    if (const bson::Value* first = doc.find(segments[0])) {
        collect(*first, segments, 1, out);
    }
    return out;
}

bool FieldPath::set(bson::Document& doc, const std::string& path, bson::Value value)
{
    return set_in(doc, split(path), 0, std::move(value));
}

bool FieldPath::erase(bson::Document& doc, const std::string& path)
{
    const auto segments = split(path);
    if (segments.size() == 1) {
        return doc.erase(segments[0]);
    }

    bson::Value* parent = doc.find(segments[0]);
    for (std::size_t i = 1; parent && i + 1 < segments.size(); ++i) {
        parent = const_cast<bson::Value*>(child(*parent, segments[i]));
    }
    if (!parent) {
        return false;
    }

    const std::string& last = segments.back();
    if (parent->is_document()) {
        return parent->as_document().erase(last);
    }
    std::size_t index = 0;
    if (parent->is_array() && as_index(last, index) && index < parent->as_array().size()) {
        // Array slots are nulled rather than removed so sibling positions stay stable.
        parent->as_array()[index] = bson::Null{};
        return true;
    }
    return false;
}

} // namespace docgate::store
