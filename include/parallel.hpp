#pragma once

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <tbb/partitioner.h>
#include <tbb/task_arena.h>

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>

namespace cbers_tiler {

/**
 * @brief 同時実行数を制限して各入力に関数を適用する
 *
 * 呼び出し毎に専用のtask_arenaを作成し、完了時に破棄する (呼び出し間でプールを共有しない)。
 * 結果は完了順ではなく入力と同じ順序で返す。
 * いずれかのタスクが例外を送出した場合、残りのタスクはキャンセルされ、
 * 最初の例外がそのまま呼び出し元に再送出される。部分的な結果は返さない。
 *
 * @param inputs 入力 (バンドのアドレス等)
 * @param max_workers 同時実行数の上限 (1以上)
 * @param func 各入力に適用する関数
 * @return 入力と同じ順序の処理結果ベクター
 */
template <typename Input, typename Func>
    requires std::invocable<Func&, const Input&>
auto ordered_parallel_map(const std::vector<Input>& inputs, size_t max_workers, Func&& func)
    -> std::vector<std::invoke_result_t<Func&, const Input&>> {
    using Result = std::invoke_result_t<Func&, const Input&>;

    if (max_workers == 0) {
        throw std::invalid_argument("max_workersは1以上である必要があります");
    }
    if (inputs.empty()) {
        return {};
    }

    // 各スロットには対応するインデックスのタスクだけが書き込む
    std::vector<std::optional<Result>> slots(inputs.size());

    tbb::task_arena arena(static_cast<int>(std::min(max_workers, inputs.size())));
    arena.execute([&] {
        // I/O待ちが主なので1入力1タスクに分割する
        tbb::parallel_for(
            tbb::blocked_range<size_t>(0, inputs.size(), 1),
            [&](const tbb::blocked_range<size_t>& range) {
                for (size_t i = range.begin(); i != range.end(); ++i) {
                    slots[i].emplace(func(inputs[i]));
                }
            },
            tbb::simple_partitioner());
    });

    std::vector<Result> results;
    results.reserve(slots.size());
    for (auto& slot : slots) {
        results.push_back(std::move(*slot));
    }
    return results;
}

}  // namespace cbers_tiler
