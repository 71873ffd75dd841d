#include"MaskFillOptions.hpp"
#include"MaskFillExceptions.hpp"

namespace maskfill {
	namespace {
		struct CacheModeName {
			CacheMode mode;
			const char* name;
		};
		constexpr std::array<CacheModeName, 6> cacheModeNames = { {
			{CacheMode::ignoreAndDelete, "ignore_and_delete"},
			{CacheMode::ignoreAndSave, "ignore_and_save"},
			{CacheMode::useCache, "use_cache"},
			{CacheMode::useAndSave, "use_and_save"},
			{CacheMode::useCacheDelete, "use_cache_delete"},
			{CacheMode::maskGridOnly, "MaskGrid_Only"}
		} };
	}

	CacheMode parseCacheMode(const std::string& s)
	{
		for (const CacheModeName& c : cacheModeNames) {
			if (EQUAL(s.c_str(), c.name)) {
				return c.mode;
			}
		}
		throw ParameterError("Invalid mask grid cache value: " + s
			+ ". Expected one of ignore_and_delete, ignore_and_save, use_cache, use_and_save, use_cache_delete, MaskGrid_Only");
	}
	std::string cacheModeName(CacheMode mode)
	{
		for (const CacheModeName& c : cacheModeNames) {
			if (c.mode == mode) {
				return c.name;
			}
		}
		return "ignore_and_delete";
	}
	bool cacheModeLoads(CacheMode mode)
	{
		return mode == CacheMode::useCache || mode == CacheMode::useAndSave || mode == CacheMode::useCacheDelete;
	}
	bool cacheModeSaves(CacheMode mode)
	{
		return mode != CacheMode::ignoreAndDelete && mode != CacheMode::useCacheDelete;
	}
	std::filesystem::path MaskFillOptions::effectiveCacheDir() const
	{
		return cacheDir.empty() ? outputDir : cacheDir;
	}
}
