#include"MaskFill.hpp"

namespace maskfill {
	cell_t nCellsInside(const Raster<mask_t>& mask)
	{
		cell_t count = 0;
		for (cell_t cell = 0; cell < mask.ncell(); ++cell) {
			if (mask[cell].value()) {
				++count;
			}
		}
		return count;
	}
	std::filesystem::path maskedFilePath(const std::filesystem::path& input, const std::filesystem::path& outputDir)
	{
		return outputDir / (input.stem().string() + "_mf" + input.extension().string());
	}
	std::filesystem::path temporaryPathFor(const std::filesystem::path& finalPath)
	{
		//the extension is kept so drivers that care about it still recognize the file
		std::string name = finalPath.stem().string() + ".tmp" + std::to_string(CPLGetPID()) + finalPath.extension().string();
		return finalPath.parent_path() / name;
	}
}
