#include"H5Wrappers.hpp"
#include"MaskFillExceptions.hpp"

namespace maskfill {
	UniqueH5Id::UniqueH5Id(hid_t id, Closer closer)
		: _id(id), _closer(closer)
	{
	}
	UniqueH5Id::~UniqueH5Id()
	{
		_close();
	}
	UniqueH5Id::UniqueH5Id(UniqueH5Id&& other) noexcept
		: _id(other._id), _closer(other._closer)
	{
		other._id = H5I_INVALID_HID;
	}
	UniqueH5Id& UniqueH5Id::operator=(UniqueH5Id&& other) noexcept
	{
		if (this != &other) {
			_close();
			_id = other._id;
			_closer = other._closer;
			other._id = H5I_INVALID_HID;
		}
		return *this;
	}
	hid_t UniqueH5Id::get() const
	{
		return _id;
	}
	UniqueH5Id::operator bool() const
	{
		return _id >= 0;
	}
	void UniqueH5Id::_close()
	{
		if (_id >= 0 && _closer) {
			_closer(_id);
		}
		_id = H5I_INVALID_HID;
	}

	H5ErrorPrintingSuppressor::H5ErrorPrintingSuppressor()
	{
		H5Eget_auto2(H5E_DEFAULT, &_func, &_data);
		H5Eset_auto2(H5E_DEFAULT, nullptr, nullptr);
	}
	H5ErrorPrintingSuppressor::~H5ErrorPrintingSuppressor()
	{
		H5Eset_auto2(H5E_DEFAULT, _func, _data);
	}

	UniqueH5Id h5OpenFileWrapper(const std::string& filename, bool readWrite)
	{
		return UniqueH5Id(H5Fopen(filename.c_str(), readWrite ? H5F_ACC_RDWR : H5F_ACC_RDONLY, H5P_DEFAULT), H5Fclose);
	}
	UniqueH5Id h5OpenObjectWrapper(hid_t loc, const std::string& name)
	{
		return UniqueH5Id(H5Oopen(loc, name.c_str(), H5P_DEFAULT), H5Oclose);
	}
	UniqueH5Id h5OpenAttributeWrapper(hid_t obj, const std::string& name)
	{
		if (!h5AttributeExists(obj, name)) {
			return UniqueH5Id();
		}
		return UniqueH5Id(H5Aopen(obj, name.c_str(), H5P_DEFAULT), H5Aclose);
	}
	UniqueH5Id h5DatasetSpaceWrapper(hid_t dataset)
	{
		return UniqueH5Id(H5Dget_space(dataset), H5Sclose);
	}
	UniqueH5Id h5DatasetTypeWrapper(hid_t dataset)
	{
		return UniqueH5Id(H5Dget_type(dataset), H5Tclose);
	}

	bool h5AttributeExists(hid_t obj, const std::string& name)
	{
		return H5Aexists(obj, name.c_str()) > 0;
	}
	hssize_t h5AttributeSize(hid_t obj, const std::string& name)
	{
		UniqueH5Id attr = h5OpenAttributeWrapper(obj, name);
		if (!attr) {
			return 0;
		}
		UniqueH5Id space{ H5Aget_space(attr.get()), H5Sclose };
		if (!space) {
			return 0;
		}
		hssize_t n = H5Sget_simple_extent_npoints(space.get());
		return n < 0 ? 0 : n;
	}

	std::optional<std::string> h5ReadStringAttribute(hid_t obj, const std::string& name)
	{
		UniqueH5Id attr = h5OpenAttributeWrapper(obj, name);
		if (!attr) {
			return std::nullopt;
		}
		UniqueH5Id type{ H5Aget_type(attr.get()), H5Tclose };
		if (!type || H5Tget_class(type.get()) != H5T_STRING) {
			return std::nullopt;
		}

		UniqueH5Id memType{ H5Tcopy(H5T_C_S1), H5Tclose };
		if (H5Tis_variable_str(type.get()) > 0) {
			H5Tset_size(memType.get(), H5T_VARIABLE);
			char* value = nullptr;
			if (H5Aread(attr.get(), memType.get(), &value) < 0) {
				return std::nullopt;
			}
			std::string out = value ? value : "";
			H5free_memory(value);
			return out;
		}

		size_t size = H5Tget_size(type.get());
		H5Tset_size(memType.get(), size + 1);
		std::vector<char> buffer(size + 1, '\0');
		if (H5Aread(attr.get(), memType.get(), buffer.data()) < 0) {
			return std::nullopt;
		}
		return std::string(buffer.data());
	}
	std::optional<std::vector<double>> h5ReadNumericAttribute(hid_t obj, const std::string& name)
	{
		UniqueH5Id attr = h5OpenAttributeWrapper(obj, name);
		if (!attr) {
			return std::nullopt;
		}
		UniqueH5Id type{ H5Aget_type(attr.get()), H5Tclose };
		H5T_class_t typeClass = H5Tget_class(type.get());
		if (typeClass != H5T_INTEGER && typeClass != H5T_FLOAT) {
			return std::nullopt;
		}
		hssize_t n = h5AttributeSize(obj, name);
		std::vector<double> out((size_t)n);
		if (n == 0 || H5Aread(attr.get(), H5T_NATIVE_DOUBLE, out.data()) < 0) {
			return std::nullopt;
		}
		return out;
	}
	void h5WriteNumericAttribute(hid_t obj, const std::string& name, double value)
	{
		UniqueH5Id attr = h5OpenAttributeWrapper(obj, name);
		if (!attr) {
			throw IOError("Unable to open attribute " + name + " of " + h5ObjectName(obj));
		}
		std::vector<double> values((size_t)h5AttributeSize(obj, name), value);
		if (values.empty() || H5Awrite(attr.get(), H5T_NATIVE_DOUBLE, values.data()) < 0) {
			throw IOError("Unable to write attribute " + name + " of " + h5ObjectName(obj));
		}
	}

	std::vector<hsize_t> h5DatasetDims(hid_t dataset)
	{
		UniqueH5Id space = h5DatasetSpaceWrapper(dataset);
		if (!space) {
			throw FormatError("Unable to read the dataspace of " + h5ObjectName(dataset));
		}
		int rank = H5Sget_simple_extent_ndims(space.get());
		if (rank < 0) {
			throw FormatError("Unable to read the dimensions of " + h5ObjectName(dataset));
		}
		std::vector<hsize_t> dims((size_t)rank);
		if (rank > 0 && H5Sget_simple_extent_dims(space.get(), dims.data(), nullptr) < 0) {
			throw FormatError("Unable to read the dimensions of " + h5ObjectName(dataset));
		}
		return dims;
	}
	std::string h5ObjectName(hid_t obj)
	{
		ssize_t size = H5Iget_name(obj, nullptr, 0);
		if (size <= 0) {
			return "<unnamed>";
		}
		std::vector<char> buffer((size_t)size + 1, '\0');
		H5Iget_name(obj, buffer.data(), buffer.size());
		return std::string(buffer.data());
	}

	namespace {
		constexpr int MAX_GROUP_DEPTH = 64;

		void collectDatasetNames(hid_t group, const std::string& groupName, std::vector<std::string>& out, int depth) {
			H5G_info_t info;
			if (H5Gget_info(group, &info) < 0) {
				throw FormatError("Unable to read the contents of group " + groupName);
			}
			for (hsize_t i = 0; i < info.nlinks; ++i) {
				ssize_t size = H5Lget_name_by_idx(group, ".", H5_INDEX_NAME, H5_ITER_INC, i, nullptr, 0, H5P_DEFAULT);
				if (size < 0) {
					throw FormatError("Unable to read the contents of group " + groupName);
				}
				std::vector<char> buffer((size_t)size + 1, '\0');
				H5Lget_name_by_idx(group, ".", H5_INDEX_NAME, H5_ITER_INC, i, buffer.data(), buffer.size(), H5P_DEFAULT);
				std::string linkName = buffer.data();
				std::string fullName = (groupName == "/" ? "" : groupName) + "/" + linkName;

				//dangling soft links and external links that can't be resolved are not data
				UniqueH5Id child = h5OpenObjectWrapper(group, linkName);
				if (!child) {
					CPLDebug("MASKFILL", "Skipping %s, which could not be opened", fullName.c_str());
					continue;
				}
				switch (H5Iget_type(child.get())) {
				case H5I_DATASET:
					out.push_back(fullName);
					break;
				case H5I_GROUP:
					//hard links can make the group structure cyclic
					if (depth < MAX_GROUP_DEPTH) {
						collectDatasetNames(child.get(), fullName, out, depth + 1);
					}
					else {
						CPLError(CE_Warning, CPLE_AppDefined, "Not descending into %s; groups are nested too deeply", fullName.c_str());
					}
					break;
				default:
					break;
				}
			}
		}
	}

	std::vector<std::string> h5AllDatasetNames(hid_t file)
	{
		std::vector<std::string> out;
		UniqueH5Id root = h5OpenObjectWrapper(file, "/");
		if (!root) {
			throw FormatError("Unable to open the root group of " + h5ObjectName(file));
		}
		collectDatasetNames(root.get(), "/", out, 0);
		return out;
	}
}
