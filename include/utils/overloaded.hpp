#pragma once

// std::visit helper: overloaded{ [](const A&) {...}, [](const B&) {...} }
template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;
