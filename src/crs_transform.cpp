#include "crs_transform.hpp"

#include <proj.h>

#include <sstream>
#include <stdexcept>

#include "errors.hpp"

namespace cbers_tiler {

namespace {

struct ContextDeleter {
    void operator()(PJ_CONTEXT* ctx) const noexcept { proj_context_destroy(ctx); }
};

struct PjDeleter {
    void operator()(PJ* pj) const noexcept { proj_destroy(pj); }
};

using ContextPtr = std::unique_ptr<PJ_CONTEXT, ContextDeleter>;
using PjPtr = std::unique_ptr<PJ, PjDeleter>;

ContextPtr make_context() {
    ContextPtr ctx(proj_context_create());
    if (!ctx) {
        throw std::runtime_error("PROJコンテキストを作成できません");
    }
    return ctx;
}

PjPtr make_crs(PJ_CONTEXT* ctx, const std::string& definition) {
    PjPtr crs(proj_create(ctx, definition.c_str()));
    if (!crs) {
        std::stringstream ss;
        ss << "CRSを解釈できません: " << definition;
        throw std::invalid_argument(ss.str());
    }
    return crs;
}

}  // namespace

class CrsTransformer::Impl {
   public:
    Impl(std::string_view src, std::string_view dst) : src_crs(src), dst_crs(dst) {
        ctx = make_context();

        // CRSが同じかチェック
        PjPtr src_pj = make_crs(ctx.get(), src_crs);
        PjPtr dst_pj = make_crs(ctx.get(), dst_crs);
        identity = proj_is_equivalent_to(src_pj.get(), dst_pj.get(), PJ_COMP_EQUIVALENT) != 0;

        PjPtr raw(proj_create_crs_to_crs(ctx.get(), src_crs.c_str(), dst_crs.c_str(), nullptr));
        if (!raw) {
            std::stringstream ss;
            ss << "座標変換を作成できません: " << src_crs << " -> " << dst_crs;
            throw std::invalid_argument(ss.str());
        }

        // 正規化された変換を取得
        PjPtr normalized(proj_normalize_for_visualization(ctx.get(), raw.get()));
        transform = normalized ? std::move(normalized) : std::move(raw);
    }

    std::string src_crs;
    std::string dst_crs;
    ContextPtr ctx;
    PjPtr transform;
    bool identity{false};
};

CrsTransformer::CrsTransformer(std::string_view src_crs, std::string_view dst_crs)
    : pImpl(std::make_unique<Impl>(src_crs, dst_crs)) {}

CrsTransformer::~CrsTransformer() = default;

CrsTransformer::CrsTransformer(CrsTransformer&&) noexcept = default;
CrsTransformer& CrsTransformer::operator=(CrsTransformer&&) noexcept = default;

auto CrsTransformer::transform_bounds(const ProjectedBounds& bounds, int densify_pts) const
    -> ProjectedBounds {
    if (densify_pts < 0) {
        throw std::invalid_argument("densify_ptsは0以上である必要があります");
    }
    if (pImpl->identity) {
        return bounds;
    }

    ProjectedBounds out;
    int ok = proj_trans_bounds(pImpl->ctx.get(), pImpl->transform.get(), PJ_FWD, bounds.min_x,
                               bounds.min_y, bounds.max_x, bounds.max_y, &out.min_x, &out.min_y,
                               &out.max_x, &out.max_y, densify_pts);
    if (!ok) {
        std::stringstream ss;
        ss << "範囲を変換できません (" << pImpl->src_crs << " -> " << pImpl->dst_crs
           << "): " << proj_context_errno_string(pImpl->ctx.get(),
                                                 proj_context_errno(pImpl->ctx.get()));
        throw IOError(ss.str());
    }
    return out;
}

void CrsTransformer::transform_points(std::span<double> xs, std::span<double> ys) const {
    if (xs.size() != ys.size()) {
        throw std::invalid_argument("x座標とy座標の数が一致しません");
    }
    if (pImpl->identity || xs.empty()) {
        return;
    }

    proj_trans_generic(pImpl->transform.get(), PJ_FWD, xs.data(), sizeof(double), xs.size(),
                       ys.data(), sizeof(double), ys.size(), nullptr, 0, 0, nullptr, 0, 0);
}

bool is_geographic_crs(std::string_view crs) {
    ContextPtr ctx = make_context();
    PjPtr pj = make_crs(ctx.get(), std::string(crs));

    switch (proj_get_type(pj.get())) {
        case PJ_TYPE_GEOGRAPHIC_CRS:
        case PJ_TYPE_GEOGRAPHIC_2D_CRS:
        case PJ_TYPE_GEOGRAPHIC_3D_CRS:
            return true;
        default:
            return false;
    }
}

}  // namespace cbers_tiler
