// examples/example_inner_text.cpp — Round-tripping fixed-point values through their inner text and bytes.

#include <iostream>
#include <stdexcept>
#include <string>

#include <decfix/decfix.hpp>

int main() {
    const auto price = decfix::FixedI128::from_rational(-7, 3);
    const std::string text = decfix::io::to_inner_string(price);
    std::cout << price << " is stored as " << text << '\n';

    const auto restored = decfix::io::from_inner_string<decfix::FixedI128>(text);
    std::cout << "restored: ";
    decfix::util::dump(std::cout, restored) << '\n';

    try {
        (void)decfix::io::from_inner_string<decfix::FixedI32>("99999999999");
    } catch (const std::out_of_range& error) {
        std::cout << "rejected: " << error.what() << '\n';
    }

    std::cout << "bytes:";
    for (const auto byte : decfix::FixedI32::from_rational(1, 2).to_bytes()) {
        std::cout << ' ' << static_cast<int>(byte);
    }
    std::cout << '\n';
    return 0;
}
