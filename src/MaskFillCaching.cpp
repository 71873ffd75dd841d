#include"MaskFillCaching.hpp"
#include<boost/uuid/name_generator_sha1.hpp>
#include<boost/uuid/uuid_io.hpp>

namespace maskfill {
	namespace {
		constexpr mask_t CACHE_NODATA = 255;
	}

	std::string maskGridId(const Alignment& a, const std::string& regionPath, RasterizePolicy policy)
	{
		std::ostringstream descriptor;
		descriptor.precision(17);
		descriptor << a.crs().getProj4() << "(";
		for (double v : a.geoTransform()) {
			descriptor << v << ",";
		}
		descriptor << ")(" << a.nrow() << "," << a.ncol() << ")" << regionPath << rasterizePolicyName(policy);

		boost::uuids::name_generator_sha1 gen(boost::uuids::ns::url());
		return boost::uuids::to_string(gen(descriptor.str()));
	}

	MaskGridCache::MaskGridCache(const std::string& regionPath, const MaskFillOptions& options)
		: _regionPath(regionPath), _cacheDir(options.effectiveCacheDir()), _mode(options.cacheMode), _policy(options.policy)
	{
	}
	const Raster<mask_t>& MaskGridCache::getMask(const Alignment& a)
	{
		std::string id = maskGridId(a, _regionPath, _policy);
		auto it = _masks.find(id);
		if (it != _masks.end()) {
			return it->second;
		}

		if (cacheModeLoads(_mode)) {
			std::optional<Raster<mask_t>> cached = _loadFromDisk(id, a);
			if (cached) {
				CPLDebug("MASKFILL", "Using cached mask grid %s", pathForId(id).string().c_str());
				_loaded.push_back(id);
				return _masks.emplace(id, std::move(*cached)).first->second;
			}
		}

		Raster<mask_t> mask = _compute(a);
		_computed.push_back(id);
		return _masks.emplace(id, std::move(mask)).first->second;
	}
	void MaskGridCache::finish()
	{
		if (cacheModeSaves(_mode) && !_computed.empty()) {
			std::error_code ec;
			std::filesystem::create_directories(_cacheDir, ec);
			if (ec) {
				throw IOError("Unable to create cache directory " + _cacheDir.string() + ": " + ec.message());
			}
			for (const std::string& id : _computed) {
				std::filesystem::path path = pathForId(id);
				_masks.at(id).writeRaster(path.string(), "GTiff", CACHE_NODATA);
				CPLDebug("MASKFILL", "Cached mask grid %s", path.string().c_str());
			}
		}
		if (_mode == CacheMode::useCacheDelete) {
			for (const std::string& id : _loaded) {
				std::filesystem::path path = pathForId(id);
				std::error_code ec;
				if (!std::filesystem::remove(path, ec) || ec) {
					CPLError(CE_Warning, CPLE_FileIO, "Unable to delete cached mask grid %s", path.string().c_str());
				}
			}
		}
		_computed.clear();
		_loaded.clear();
	}
	std::filesystem::path MaskGridCache::pathForId(const std::string& id) const
	{
		return _cacheDir / (id + ".tif");
	}
	CacheMode MaskGridCache::mode() const
	{
		return _mode;
	}
	std::optional<Raster<mask_t>> MaskGridCache::_loadFromDisk(const std::string& id, const Alignment& a) const
	{
		std::filesystem::path path = pathForId(id);
		if (!std::filesystem::exists(path)) {
			return std::nullopt;
		}
		Raster<mask_t> cached{ path.string() };
		if (cached.nrow() != a.nrow() || cached.ncol() != a.ncol()) {
			CPLError(CE_Warning, CPLE_AppDefined, "Cached mask grid %s does not match the grid; recomputing it", path.string().c_str());
			return std::nullopt;
		}
		for (cell_t cell = 0; cell < cached.ncell(); ++cell) {
			cached[cell].has_value() = true;
		}
		return cached;
	}
	Raster<mask_t> MaskGridCache::_compute(const Alignment& a)
	{
		if (!_region) {
			_region.emplace(_regionPath);
		}
		if (_region->crs().isConsistentHoriz(a.crs())) {
			return rasterizeRegion(a, *_region, _policy);
		}
		Region projected = *_region;
		projected.projectInPlace(a.crs());
		return rasterizeRegion(a, projected, _policy);
	}
}
