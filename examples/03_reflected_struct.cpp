// 03_reflected_struct.cpp: Deriving a shape from a C++ aggregate
//
// Shows: shape_description<T> with field_list<field<...>>, shape_of<T>(),
//        type_of<T>() for standard types, member functions as methods.

#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <shapetype/shapetype.hpp>

using namespace shapetype;

struct Account {
    const std::string id;
    std::optional<std::string> nickname;
    std::vector<double> balances;
    std::function<void(double)> on_deposit;

    double total() const {
        double sum = 0;
        for (double b : balances)
            sum += b;
        return sum;
    }
};

template <> struct shapetype::shape_description<Account> {
    using fields = field_list<field<"id", &Account::id>,
                              field<"nickname", &Account::nickname>,
                              field<"balances", &Account::balances>,
                              field<"onDeposit", &Account::on_deposit>,
                              field<"total", &Account::total>>;
};

int main() {
    constexpr auto account = shape_of<Account>();
    constexpr auto text = pretty_print(account);
    static_assert(text == "{ readonly id: string; nickname?: string; "
                          "balances: number[]; onDeposit: (arg0: number) => "
                          "void; readonly total: () => number }");

    constexpr auto methods = pretty_print(function_keys(account));
    constexpr auto fixed = pretty_print(readonly_keys(account));
    constexpr auto optional = pretty_print(optional_keys(account));
    static_assert(methods == "{onDeposit, total}");
    static_assert(fixed == "{id, total}");

    // The value types of standard containers
    constexpr auto lookup =
        pretty_print(type_of<std::optional<std::vector<std::string>>>());
    static_assert(lookup == "string[] | undefined");

    std::cout << "Account:        " << text.data << "\n";
    std::cout << "methods:        " << methods.data << "\n";
    std::cout << "readonly keys:  " << fixed.data << "\n";
    std::cout << "optional keys:  " << optional.data << "\n";
    std::cout << "optional<vector<string>>: " << lookup.data << "\n";

    Account a{"acc-1", std::nullopt, {10.0, 2.5}, nullptr};
    std::cout << "runtime total:  " << a.total() << "\n";
}
