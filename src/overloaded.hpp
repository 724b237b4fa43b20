#pragma once

namespace bulkdl::detail
{

// Visitor built from a set of lambdas, for exhaustive std::visit
template <class... Ts>
struct overloaded : Ts...
{
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

} // namespace bulkdl::detail
