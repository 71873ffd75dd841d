#include"ProjWrappers.hpp"
#include"GDALWrappers.hpp"

namespace maskfill {

	PJ_CONTEXT* ProjContextByThread::get()
	{
		static std::mutex mut;
		std::scoped_lock<std::mutex> lock{ mut };
		std::thread::id thisthread = std::this_thread::get_id();
		if (!_ctxs.count(thisthread)) {
			_ctxs.emplace(thisthread, getNewPJContext());

#ifdef MASKFILL_PROJ_DATA
			setProjDirectory(MASKFILL_PROJ_DATA, _ctxs.at(thisthread).get());
#endif
		}
		return _ctxs.at(thisthread).get();
	}
	SharedPJ makeSharedPJ(PJ* pj)
	{
		return SharedPJ(pj,
			[](PJ* pj) {
				if (pj) {
					proj_destroy(pj);
				}
			}
		);
	}
	SharedPJCtx getNewPJContext()
	{
		return SharedPJCtx(proj_context_create(),
			[](PJ_CONTEXT* pjc) {
				if (pjc) {
					proj_context_destroy(pjc);
				}
			}
		);
	}
	SharedPJ projCreateWrapper(const std::string& s)
	{
		return makeSharedPJ(proj_create(ProjContextByThread::get(), s.c_str()));
	}
	SharedPJ projCrsToCrsWrapper(SharedPJ from, SharedPJ to)
	{
		if (!from || !to) {
			return SharedPJ();
		}
		SharedPJ out = makeSharedPJ(proj_create_crs_to_crs_from_pj(
			ProjContextByThread::get(), from.get(), to.get(), nullptr, nullptr)
		);
		if (out) {
			//data read through GDAL/OGR is always in x/y (easting/northing, lon/lat) order
			out = makeSharedPJ(
				proj_normalize_for_visualization(ProjContextByThread::get(), out.get())
			);
		}
		return out;
	}
	SharedPJ getSubCrs(const SharedPJ base, int index)
	{
		return makeSharedPJ(
			proj_crs_get_sub_crs(ProjContextByThread::get(), base.get(), index)
		);
	}
	SharedPJ sharedPJFromOSR(const OGRSpatialReference& osr)
	{
		UniqueGdalString wkt = exportToWktWrapper(osr);
		if (!wkt) {
			return SharedPJ();
		}
		return projCreateWrapper(wkt.get());
	}
	SharedPJ getHorizontalCrs(const SharedPJ& crs)
	{
		if (!crs) {
			return SharedPJ();
		}
		PJ_CONTEXT* ctx = ProjContextByThread::get();
		switch (proj_get_type(crs.get())) {
		case PJ_TYPE_CRS:
		case PJ_TYPE_GEOCENTRIC_CRS:
		case PJ_TYPE_GEOGRAPHIC_CRS:
		case PJ_TYPE_GEOGRAPHIC_2D_CRS:
		case PJ_TYPE_PROJECTED_CRS:
		case PJ_TYPE_ENGINEERING_CRS:
		case PJ_TYPE_OTHER_CRS:
			return crs;
		case PJ_TYPE_GEOGRAPHIC_3D_CRS:
			return getHorizontalCrs(makeSharedPJ(proj_crs_demote_to_2D(ctx, nullptr, crs.get())));
		case PJ_TYPE_COMPOUND_CRS: {
			//the horizontal part is normally first, but nothing enforces that
			SharedPJ first = getHorizontalCrs(getSubCrs(crs, 0));
			return first ? first : getHorizontalCrs(getSubCrs(crs, 1));
		}
		case PJ_TYPE_BOUND_CRS:
		case PJ_TYPE_DERIVED_PROJECTED_CRS:
			return getHorizontalCrs(makeSharedPJ(proj_get_source_crs(ctx, crs.get())));
		default:
			//datums, ellipsoids, vertical and temporal CRSs, and coordinate operations have no horizontal part
			return SharedPJ();
		}
	}
	bool setProjDirectory(const std::string& path, PJ_CONTEXT* context)
	{
		namespace fs = std::filesystem;
		std::string folder;
		if (!fs::is_directory(path)) {
			folder = fs::path(path).parent_path().string();
		}
		else {
			folder = path;
		}
		const char* data = folder.c_str();
		proj_context_set_search_paths(context, 1, &data);

		return true;
	}
}
