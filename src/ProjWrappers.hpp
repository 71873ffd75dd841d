#pragma once
#ifndef mf_projwrappers_h
#define mf_projwrappers_h

#include"maskfill_pch.hpp"
#include"MaskFillTypeDefs.hpp"


namespace maskfill {

	using SharedPJ = std::shared_ptr<PJ>;
	SharedPJ makeSharedPJ(PJ* pj);

	using SharedPJCtx = std::shared_ptr<PJ_CONTEXT>;
	SharedPJCtx getNewPJContext();

	//PJ_CONTEXT objects may not be shared between threads, so each thread gets its own
	class ProjContextByThread {
	private:
		inline static std::unordered_map<std::thread::id, SharedPJCtx> _ctxs;
	public:
		static PJ_CONTEXT* get();
	};

	SharedPJ projCreateWrapper(const std::string& s);
	SharedPJ projCrsToCrsWrapper(SharedPJ from, SharedPJ to);
	SharedPJ getSubCrs(const SharedPJ base, int index);

	SharedPJ sharedPJFromOSR(const OGRSpatialReference& osr);

	SharedPJ getHorizontalCrs(const SharedPJ& crs);

	bool setProjDirectory(const std::string& path, PJ_CONTEXT* context);
}

#endif
