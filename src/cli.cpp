/**
 * @file cli.cpp
 * @brief BitUInt command line calculator.
 *
 * Applies one bitwise or arithmetic operator to two operands and prints
 * the operands and the result in binary and, where it fits, decimal.
 */

#include <bituint/bituint.hpp>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

using namespace bituint;

enum class Op { And, Or, Xor, Add, Sub, Mul, Invalid };

static void print_version() {
    std::printf("bituint %s (C++)\n", version());
}

static void print_help(const char* prog_name) {
    std::printf("\nBit-level arbitrary-length unsigned arithmetic (v%s C++)\n", version());
    std::printf("=======================================================\n\n");
    std::printf("Usage:\n");
    std::printf("  %s <a> <op> <b>\n\n", prog_name);
    std::printf("Options:\n");
    std::printf("  -h, --help     Show this help message\n");
    std::printf("  -v, --version  Show version information\n\n");
    std::printf("Operands:\n");
    std::printf("  decimal        Unsigned native integer (e.g., 200)\n");
    std::printf("  binary         Binary literal with 0b prefix (e.g., 0b011001000)\n\n");
    std::printf("Operators:\n");
    std::printf("  and, &         Bitwise AND (aligned at the least significant bit)\n");
    std::printf("  or,  |         Bitwise OR\n");
    std::printf("  xor, ^         Bitwise XOR\n");
    std::printf("  add, +         Ripple-carry addition\n");
    std::printf("  sub, -         Subtraction, floored at zero\n");
    std::printf("  mul, x         Booth's multiplication\n\n");
    std::printf("Examples:\n");
    std::printf("  %s 6 mul 7                # 0b000101010 (42)\n", prog_name);
    std::printf("  %s 3 - 5                  # 0b0 (0)\n", prog_name);
    std::printf("  %s 0b0101 xor 0b011       # 0b0110 (6)\n\n", prog_name);
}

static Op parse_op(const char* text) {
    const std::string op(text);
    if (op == "and" || op == "&") {
        return Op::And;
    }
    if (op == "or" || op == "|") {
        return Op::Or;
    }
    if (op == "xor" || op == "^") {
        return Op::Xor;
    }
    if (op == "add" || op == "+") {
        return Op::Add;
    }
    if (op == "sub" || op == "-") {
        return Op::Sub;
    }
    if (op == "mul" || op == "x" || op == "*") {
        return Op::Mul;
    }
    return Op::Invalid;
}

static Error parse_operand(const char* text, UInt& out) {
    if (std::strncmp(text, BINARY_PREFIX, BINARY_PREFIX_LENGTH) == 0) {
        return UInt::parse(text, out);
    }

    if (*text == '\0' || *text == '-' || *text == '+') {
        return Error::InvalidArg;
    }

    char* end = nullptr;
    errno = 0;
    unsigned long long value = std::strtoull(text, &end, 10);
    if (errno == ERANGE) {
        return Error::Overflow;
    }
    if (*end != '\0') {
        return Error::InvalidArg;
    }

    out = UInt(static_cast<native_t>(value));
    return Error::Ok;
}

static void print_value(const char* label, const UInt& value) {
    native_t native = 0;
    if (value.to_native(native) == Error::Ok) {
        std::printf("%-9s %s (%llu, %zu bits)\n", label, value.to_string().c_str(),
                    static_cast<unsigned long long>(native), value.length());
    } else {
        std::printf("%-9s %s (%zu bits, exceeds %zu-bit native)\n", label,
                    value.to_string().c_str(), value.length(), NATIVE_BITS);
    }
}

int main(int argc, char** argv) {
    // Check for help flag
    if (argc < 2 || std::strcmp(argv[1], "-h") == 0 || std::strcmp(argv[1], "--help") == 0) {
        print_help(argv[0]);
        return (argc < 2) ? 1 : 0;
    }

    // Check for version flag
    if (std::strcmp(argv[1], "-v") == 0 || std::strcmp(argv[1], "--version") == 0) {
        print_version();
        return 0;
    }

    if (argc != 4) {
        std::fprintf(stderr, "Error: Expected 3 arguments\n");
        std::fprintf(stderr, "Usage: %s <a> <op> <b>\n", argv[0]);
        return 1;
    }

    UInt a;
    UInt b;

    Error result = parse_operand(argv[1], a);
    if (result != Error::Ok) {
        std::fprintf(stderr, "Error: Invalid operand '%s': %s\n", argv[1], error_string(result));
        return 1;
    }

    result = parse_operand(argv[3], b);
    if (result != Error::Ok) {
        std::fprintf(stderr, "Error: Invalid operand '%s': %s\n", argv[3], error_string(result));
        return 1;
    }

    UInt value;
    switch (parse_op(argv[2])) {
    case Op::And:
        value = a & b;
        break;
    case Op::Or:
        value = a | b;
        break;
    case Op::Xor:
        value = a ^ b;
        break;
    case Op::Add:
        value = a + b;
        break;
    case Op::Sub:
        value = a - b;
        break;
    case Op::Mul:
        value = a * b;
        break;
    case Op::Invalid:
    default:
        std::fprintf(stderr, "Error: Unknown operator '%s'\n", argv[2]);
        return 1;
    }

    print_value("a:", a);
    print_value("b:", b);
    print_value("result:", value);

    return 0;
}
