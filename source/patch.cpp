// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <treepath/patch.h>
#include <treepath/editor.h>
#include <treepath/resolver.h>

#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace treepath {

std::string_view to_string(OpKind kind) noexcept
{
    switch (kind) {
    case OpKind::Add:     return "add";
    case OpKind::Remove:  return "remove";
    case OpKind::Replace: return "replace";
    case OpKind::Move:    return "move";
    case OpKind::Copy:    return "copy";
    case OpKind::Test:    return "test";
    }
    return "unknown";
}

std::optional<OpKind> parse_op_kind(std::string_view name) noexcept
{
    if (name == "add") return OpKind::Add;
    if (name == "remove") return OpKind::Remove;
    if (name == "replace") return OpKind::Replace;
    if (name == "move") return OpKind::Move;
    if (name == "copy") return OpKind::Copy;
    if (name == "test") return OpKind::Test;
    return std::nullopt;
}

// ============================================================
// Operation
// ============================================================

Operation::Operation(OpKind op_, Path path_, Path from_, Value value_)
    : op(op_)
    , path(std::move(path_))
    , from(std::move(from_))
    , value(std::move(value_))
{}

Operation::Operation(const Operation& other)
    : op(other.op)
    , path(other.path)
    , from(other.from)
    , value(other.value.clone())
{}

Operation& Operation::operator=(const Operation& other)
{
    if (this != &other) {
        op = other.op;
        path = other.path;
        from = other.from;
        value = other.value.clone();
    }
    return *this;
}

Operation Operation::add(Path path, Value value)
{
    return Operation{OpKind::Add, std::move(path), Path{}, std::move(value)};
}

Operation Operation::remove(Path path)
{
    return Operation{OpKind::Remove, std::move(path), Path{}, Value{}};
}

Operation Operation::replace(Path path, Value value)
{
    return Operation{OpKind::Replace, std::move(path), Path{}, std::move(value)};
}

Operation Operation::move(Path from, Path path)
{
    return Operation{OpKind::Move, std::move(path), std::move(from), Value{}};
}

Operation Operation::copy(Path from, Path path)
{
    return Operation{OpKind::Copy, std::move(path), std::move(from), Value{}};
}

Operation Operation::test(Path path, Value value)
{
    return Operation{OpKind::Test, std::move(path), Path{}, std::move(value)};
}

bool Operation::operator==(const Operation& other) const
{
    return op == other.op && path == other.path && from == other.from && value == other.value;
}

// ============================================================
// PatchError
// ============================================================

namespace {

std::string patch_error_message(std::size_t operation_index, OpKind kind, ErrorCode cause,
                                const std::string& cause_message)
{
    return "patch operation " + std::to_string(operation_index) + " (" + std::string{to_string(kind)} +
           ") failed with " + std::string{to_string(cause)} + ": " + cause_message;
}

} // anonymous namespace

PatchError::PatchError(std::size_t operation_index, OpKind operation_kind, ErrorCode cause,
                       const std::string& cause_message, Path path, std::size_t failed_at_index)
    : PathError(ErrorCode::PatchOperationFailed,
                patch_error_message(operation_index, operation_kind, cause, cause_message), std::move(path),
                failed_at_index)
    , operation_index_(operation_index)
    , operation_kind_(operation_kind)
    , cause_(cause)
{}

// ============================================================
// Applying patches
// ============================================================

namespace {

void apply_test(const Value& root, const Operation& operation)
{
    const Value& current = get(root, operation.path);
    if (current != operation.value) {
        throw PathError(ErrorCode::TestFailed,
                        "value at " + path_to_string(operation.path) + " is " + current.to_string() +
                            ", expected " + operation.value.to_string(),
                        operation.path, operation.path.size());
    }
}

void apply_operation(Value& root, const Operation& operation)
{
    switch (operation.op) {
    case OpKind::Add:
        detail::add_into(root, operation.path, operation.value.clone());
        break;
    case OpKind::Remove:
        (void)detail::remove_from(root, operation.path);
        break;
    case OpKind::Replace:
        detail::replace_into(root, operation.path, operation.value.clone());
        break;
    case OpKind::Move:
        detail::move_into(root, operation.from, operation.path);
        break;
    case OpKind::Copy:
        detail::copy_into(root, operation.from, operation.path);
        break;
    case OpKind::Test:
        apply_test(root, operation);
        break;
    }
}

void apply_all(Value& root, const std::vector<Operation>& operations)
{
    for (std::size_t i = 0; i < operations.size(); ++i) {
        const auto& operation = operations[i];
        try {
            apply_operation(root, operation);
        } catch (const PathError& e) {
            detail::log_patch_error("patch", i, to_string(operation.op), e.what());
            throw PatchError(i, operation.op, e.code(), e.what(), e.path(), e.failed_at_index());
        }
    }
}

} // anonymous namespace

Value patch(const Value& root, const std::vector<Operation>& operations)
{
    return detail::edit_copy(root, [&](Value& work) { apply_all(work, operations); });
}

Value& patch(Value& root, const std::vector<Operation>& operations, in_place_t)
{
    apply_all(root, operations);
    return root;
}

Value patch(const Value& root, const Value& document)
{
    return patch(root, parse_patch(document));
}

Value& patch(Value& root, const Value& document, in_place_t)
{
    return patch(root, parse_patch(document), in_place);
}

// ============================================================
// Patch document codec
// ============================================================

namespace {

[[noreturn]] void invalid_record(std::size_t index, const std::string& reason)
{
    std::string message = "patch record " + std::to_string(index) + ": " + reason;
    detail::log_access_error("parse_patch", message);
    throw PathError(ErrorCode::InvalidPatch, message);
}

Path decode_path_member(const Value& member, std::size_t index, std::string_view name)
{
    if (member.is_string()) {
        try {
            return parse_path(member.as_string_view());
        } catch (const PathError& e) {
            invalid_record(index, "'" + std::string{name} + "' " + e.what());
        }
    }

    const auto* steps = member.get_vector_data();
    if (!steps) {
        invalid_record(index, "'" + std::string{name} + "' must be a string or a vector of steps");
    }

    Path path;
    for (const auto& step : *steps) {
        if (step.is_string()) {
            path.push_back(step.as_string());
        } else if (step.is_int()) {
            path.push_back(PathStep{step.as_int()}.element);
        } else {
            invalid_record(index, "'" + std::string{name} + "' step " + step.to_string() +
                                      " is neither a key nor an integer");
        }
    }
    return path;
}

Value encode_path(const Path& path)
{
    std::string pointer = path_to_pointer(path);
    if (parse_path(pointer) == path) {
        return Value{std::move(pointer)};
    }

    // Keys such as "0" or "last" do not survive pointer text
    ValueVector steps;
    steps.reserve(path.size());
    for (const auto& elem : path) {
        std::visit([&steps](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::string>) {
                steps.emplace_back(v);
            } else if constexpr (std::is_same_v<T, std::size_t>) {
                steps.emplace_back(static_cast<int64_t>(v));
            } else {
                steps.emplace_back(-static_cast<int64_t>(v.offset) - 1);
            }
        }, elem);
    }
    return Value{std::move(steps)};
}

} // anonymous namespace

std::vector<Operation> parse_patch(const Value& document)
{
    const auto* records = document.get_vector_data();
    if (!records) {
        throw PathError(ErrorCode::InvalidPatch,
                        "patch document must be a vector, got " + std::string{to_string(document.kind())});
    }

    std::vector<Operation> operations;
    operations.reserve(records->size());

    for (std::size_t i = 0; i < records->size(); ++i) {
        const Value& record = (*records)[i];
        if (!record.is_map()) {
            invalid_record(i, "must be a map, got " + std::string{to_string(record.kind())});
        }

        const Value* op_member = record.get("op");
        if (!op_member || !op_member->is_string()) {
            invalid_record(i, "missing string member 'op'");
        }
        auto kind = parse_op_kind(op_member->as_string_view());
        if (!kind) {
            invalid_record(i, "unknown op '" + op_member->as_string() + "'");
        }

        const Value* path_member = record.get("path");
        if (!path_member) {
            invalid_record(i, "missing member 'path'");
        }

        Operation operation;
        operation.op = *kind;
        operation.path = decode_path_member(*path_member, i, "path");

        if (*kind == OpKind::Move || *kind == OpKind::Copy) {
            const Value* from_member = record.get("from");
            if (!from_member) {
                invalid_record(i, "'" + std::string{to_string(*kind)} + "' requires member 'from'");
            }
            operation.from = decode_path_member(*from_member, i, "from");
        }

        if (*kind == OpKind::Add || *kind == OpKind::Replace || *kind == OpKind::Test) {
            const Value* value_member = record.get("value");
            if (!value_member) {
                invalid_record(i, "'" + std::string{to_string(*kind)} + "' requires member 'value'");
            }
            operation.value = value_member->clone();
        }

        operations.push_back(std::move(operation));
    }

    return operations;
}

Value patch_to_value(const std::vector<Operation>& operations)
{
    ValueVector records;
    records.reserve(operations.size());

    for (const auto& operation : operations) {
        Value record = Value::map();
        record.set("op", to_string(operation.op));
        record.set("path", encode_path(operation.path));

        switch (operation.op) {
        case OpKind::Move:
        case OpKind::Copy:
            record.set("from", encode_path(operation.from));
            break;
        case OpKind::Add:
        case OpKind::Replace:
        case OpKind::Test:
            record.set("value", operation.value.clone());
            break;
        case OpKind::Remove:
            break;
        }

        records.push_back(std::move(record));
    }

    return Value{std::move(records)};
}

} // namespace treepath
