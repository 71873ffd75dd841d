#include"CoordTransform.hpp"
#include"MaskFillExceptions.hpp"

namespace maskfill {
	CoordTransform::CoordTransform(const CoordRef& src, const CoordRef& dst) : _src(src), _dst(dst) {
		_needXYConv = !src.isConsistentHoriz(dst);
		if (_needXYConv) {
			_tr = projCrsToCrsWrapper(src.getSharedPtr(), dst.getSharedPtr());
			if (!_tr) {
				throw ReprojectionError("No transformation available from " + src.getShortName() + " to " + dst.getShortName());
			}
		}
	}

	void CoordTransform::transformXY(CoordXYVector& points) const
	{
		if (!_needXYConv || points.empty()) {
			return;
		}
		proj_errno_reset(_tr.get());
		proj_trans_generic(_tr.get(), PJ_FWD,
			&points[0].x, sizeof(CoordXY), points.size(),
			&points[0].y, sizeof(CoordXY), points.size(),
			nullptr, 0, 0,
			nullptr, 0, 0);
		for (const CoordXY& xy : points) {
			_checkFinite(xy.x, xy.y);
		}
	}

	CoordXY CoordTransform::transformSingleXY(coord_t x, coord_t y) const
	{
		if (!_needXYConv) {
			return { x,y };
		}
		proj_trans_generic(_tr.get(), PJ_FWD,
			&x, 0, 1,
			&y, 0, 1,
			nullptr, 0, 0,
			nullptr, 0, 0);
		_checkFinite(x, y);
		return { x,y };
	}

	bool CoordTransform::isNoOp() const
	{
		return !_needXYConv;
	}

	PJ* CoordTransform::getPtr() {
		return _tr.get();
	}

	const PJ* CoordTransform::getPtr() const {
		return _tr.get();
	}

	const SharedPJ& CoordTransform::getSharedPtr() const
	{
		return _tr;
	}
	const CoordRef& CoordTransform::src() const
	{
		return _src;
	}
	const CoordRef& CoordTransform::dst() const
	{
		return _dst;
	}
	void CoordTransform::_checkFinite(coord_t x, coord_t y)
	{
		//proj reports failed points as HUGE_VAL
		if (!std::isfinite(x) || !std::isfinite(y)) {
			throw ReprojectionError("Coordinate could not be transformed");
		}
	}

	size_t CoordTransformFactory::CoordRefPairHasher::operator()(const CoordRefPair& p) const
	{
		size_t h1 = CoordRefHasher()(p.first);
		size_t h2 = CoordRefHasher()(p.second);
		return h1 ^ (h2 << 1);
	}
	bool CoordTransformFactory::CoordRefPairEqual::operator()(const CoordRefPair& a, const CoordRefPair& b) const
	{
		return a.first.equalForHash(b.first) && a.second.equalForHash(b.second);
	}
	const CoordTransform& CoordTransformFactory::getTransform(const CoordRef& src, const CoordRef& dst)
	{
		CoordRefPair p = std::make_pair(src, dst);
		{
			std::shared_lock lock{ _mut };
			auto it = _cache.find(p);
			if (it != _cache.end()) {
				return *(it->second);
			}
		}

		std::unique_lock lock{ _mut };
		auto it = _cache.find(p);
		if (it == _cache.end()) {
			it = _cache.emplace(p, std::make_unique<CoordTransform>(src, dst)).first;
		}
		return *(it->second);
	}
	std::shared_mutex CoordTransformFactory::_mut;
	std::unordered_map<CoordTransformFactory::CoordRefPair, std::unique_ptr<CoordTransform>,
		CoordTransformFactory::CoordRefPairHasher, CoordTransformFactory::CoordRefPairEqual> CoordTransformFactory::_cache;
}
