#pragma once
#ifndef mf_h5wrappers_h
#define mf_h5wrappers_h

#include"maskfill_pch.hpp"
#include<hdf5.h>

namespace maskfill {

	//Owns an HDF5 identifier and closes it with the matching H5*close function
	class UniqueH5Id {
	public:
		using Closer = herr_t(*)(hid_t);

		UniqueH5Id() = default;
		UniqueH5Id(hid_t id, Closer closer);
		~UniqueH5Id();

		UniqueH5Id(const UniqueH5Id&) = delete;
		UniqueH5Id& operator=(const UniqueH5Id&) = delete;
		UniqueH5Id(UniqueH5Id&& other) noexcept;
		UniqueH5Id& operator=(UniqueH5Id&& other) noexcept;

		hid_t get() const;
		explicit operator bool() const;

	private:
		hid_t _id = H5I_INVALID_HID;
		Closer _closer = nullptr;

		void _close();
	};

	//turns off HDF5's automatic printing of its error stack for as long as it's alive
	class H5ErrorPrintingSuppressor {
	public:
		H5ErrorPrintingSuppressor();
		~H5ErrorPrintingSuppressor();
		H5ErrorPrintingSuppressor(const H5ErrorPrintingSuppressor&) = delete;
		H5ErrorPrintingSuppressor& operator=(const H5ErrorPrintingSuppressor&) = delete;
	private:
		H5E_auto2_t _func = nullptr;
		void* _data = nullptr;
	};

	//these return an invalid id on failure
	UniqueH5Id h5OpenFileWrapper(const std::string& filename, bool readWrite);
	UniqueH5Id h5OpenObjectWrapper(hid_t loc, const std::string& name);
	UniqueH5Id h5OpenAttributeWrapper(hid_t obj, const std::string& name);
	UniqueH5Id h5DatasetSpaceWrapper(hid_t dataset);
	UniqueH5Id h5DatasetTypeWrapper(hid_t dataset);

	bool h5AttributeExists(hid_t obj, const std::string& name);
	//the number of elements in the attribute, or 0 if it doesn't exist
	hssize_t h5AttributeSize(hid_t obj, const std::string& name);

	//reads a fixed or variable length string attribute; nothing if the attribute is missing or isn't a string
	std::optional<std::string> h5ReadStringAttribute(hid_t obj, const std::string& name);
	//reads a numeric attribute, converted to double; nothing if the attribute is missing or isn't numeric
	std::optional<std::vector<double>> h5ReadNumericAttribute(hid_t obj, const std::string& name);
	//writes every element of a numeric attribute, converting from double to the attribute's type
	//throws IOError on failure
	void h5WriteNumericAttribute(hid_t obj, const std::string& name, double value);

	std::vector<hsize_t> h5DatasetDims(hid_t dataset);
	std::string h5ObjectName(hid_t obj);

	//the full names of every dataset in the file, found by recursing through the groups
	std::vector<std::string> h5AllDatasetNames(hid_t file);

	template<class T>
	hid_t h5NativeType() {
		if constexpr (std::is_same_v<T, std::uint8_t>) {
			return H5T_NATIVE_UINT8;
		}
		else if constexpr (std::is_same_v<T, std::int8_t>) {
			return H5T_NATIVE_INT8;
		}
		else if constexpr (std::is_same_v<T, std::int16_t>) {
			return H5T_NATIVE_INT16;
		}
		else if constexpr (std::is_same_v<T, std::uint16_t>) {
			return H5T_NATIVE_UINT16;
		}
		else if constexpr (std::is_same_v<T, std::int32_t>) {
			return H5T_NATIVE_INT32;
		}
		else if constexpr (std::is_same_v<T, std::uint32_t>) {
			return H5T_NATIVE_UINT32;
		}
		else if constexpr (std::is_same_v<T, std::int64_t>) {
			return H5T_NATIVE_INT64;
		}
		else if constexpr (std::is_same_v<T, std::uint64_t>) {
			return H5T_NATIVE_UINT64;
		}
		else if constexpr (std::is_same_v<T, float>) {
			return H5T_NATIVE_FLOAT;
		}
		else {
			static_assert(std::is_same_v<T, double>, "unsupported HDF5 sample type");
			return H5T_NATIVE_DOUBLE;
		}
	}
}

#endif
