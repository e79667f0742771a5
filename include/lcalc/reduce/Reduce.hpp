// include/lcalc/reduce/Reduce.hpp
#pragma once
#include <lcalc/term/Term.hpp>

#include <cstdint>
#include <functional>
#include <string_view>


namespace lcalc::reduce {

    /// @brief normal-order, lazy argument. function 쪽만 줄이고 abstraction body는 건드리지 않는다.
    /// 자원 제한이 없으며 normal form이 없는 term에서는 끝나지 않는다.
    term::TermPtr beta_reduce(const term::Term& t);

    enum class Strategy : uint8_t {
        kWeakHead,   // beta_reduce와 같은 의미
        kNormalForm, // binder 아래까지 normal-order 정규화
    };

    enum class ReduceStatus : uint8_t {
        kNormal,
        kStepLimit,
        kSizeLimit,
        kStuck,
    };

    // 0 = unlimited
    struct Budget {
        uint64_t max_steps = 0;
        uint64_t max_nodes = 0;
    };

    /// @brief (1-based step, contraction 직후의 focus term)
    /// weak-head 모드에서 focus는 term 전체다.
    using StepObserver = std::function<void(uint64_t, const term::Term&)>;

    struct ReduceOptions {
        Budget budget{};
        Strategy strategy = Strategy::kWeakHead;
        StepObserver on_step{};
    };

    struct ReduceResult {
        term::TermPtr term;
        ReduceStatus status = ReduceStatus::kNormal;
        uint64_t steps = 0;
    };

    /// @brief explicit spine stack으로 동작하는 bounded reducer. 입력은 변경하지 않는다.
    ReduceResult reduce(const term::Term& t, const ReduceOptions& opt = {});

    std::string_view reduce_status_name(ReduceStatus s);
    std::string_view strategy_name(Strategy s);

} // namespace lcalc::reduce
