#include"CoordRef.hpp"
#include"MaskFillExceptions.hpp"

namespace maskfill {
	CoordRef::CoordRef(const std::string& s)
	{
		_initFromString(s);
	}
	CoordRef::CoordRef(const char* s)
	{
		_initFromString(s ? std::string(s) : std::string());
	}
	CoordRef::CoordRef(const OGRSpatialReference* osr)
	{
		if (!osr || osr->IsEmpty()) {
			return;
		}
		_p = sharedPJFromOSR(*osr);
		if (!_p) {
			throw ReprojectionError("Unable to interpret spatial reference from GDAL");
		}
		_wkt = getCompleteWKT();
	}
	bool CoordRef::isEmpty() const
	{
		return !_p;
	}
	std::string CoordRef::getCompleteWKT() const
	{
		if (isEmpty()) {
			return "";
		}
		const char* wkt = proj_as_wkt(ProjContextByThread::get(), _p.get(), PJ_WKT2_2019, nullptr);
		return wkt ? std::string(wkt) : std::string();
	}
	std::string CoordRef::getProj4() const
	{
		if (isEmpty()) {
			return "";
		}
		const char* proj = proj_as_proj_string(ProjContextByThread::get(), _p.get(), PJ_PROJ_5, nullptr);
		if (!proj) {
			//not every CRS has a PROJ string representation
			return _wkt;
		}
		return std::string(proj);
	}
	std::string CoordRef::getShortName() const
	{
		if (isEmpty()) {
			return "Unknown";
		}
		const char* name = proj_get_name(_p.get());
		return name ? std::string(name) : std::string("Unknown");
	}
	bool CoordRef::isConsistentHoriz(const CoordRef& other) const
	{
		if (isEmpty() || other.isEmpty()) {
			return true;
		}
		SharedPJ thisHoriz = getHorizontalCrs(_p);
		SharedPJ otherHoriz = getHorizontalCrs(other._p);
		if (!thisHoriz || !otherHoriz) {
			return true;
		}
		return proj_is_equivalent_to_with_ctx(ProjContextByThread::get(), thisHoriz.get(), otherHoriz.get(),
			PJ_COMP_EQUIVALENT_EXCEPT_AXIS_ORDER_GEOGCRS);
	}
	const SharedPJ& CoordRef::getSharedPtr() const
	{
		return _p;
	}
	bool CoordRef::equalForHash(const CoordRef& other) const
	{
		return _wkt == other._wkt;
	}
	void CoordRef::_initFromString(const std::string& s)
	{
		if (s.empty()) {
			return;
		}
		std::string toParse = s;
		if (std::all_of(s.begin(), s.end(), [](unsigned char c) {return std::isdigit(c); })) {
			toParse = "EPSG:" + s;
		}
		//without +type=crs, proj_create reads a PROJ string as a coordinate operation
		else if (s.rfind("+proj=", 0) == 0 && s.find("+type=crs") == std::string::npos) {
			toParse = s + " +type=crs";
		}
		_p = projCreateWrapper(toParse);
		if (!_p) {
			throw ReprojectionError("Unable to interpret '" + s + "' as a coordinate reference system");
		}
		_wkt = getCompleteWKT();
	}
	size_t CoordRefHasher::operator()(const CoordRef& c) const
	{
		return std::hash<std::string>()(c.getCompleteWKT());
	}
}
