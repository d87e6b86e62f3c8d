#include "nrt_predict/io/gdal_backend.hpp"
#include "nrt_predict/core/errors.hpp"

#include <cpl_conv.h>
#include <cpl_error.h>
#include <cpl_http.h>
#include <cpl_string.h>
#include <cpl_vsi.h>
#include <gdal_priv.h>
#include <gdal_utils.h>
#include <ogrsf_frmts.h>

#include <cstring>
#include <memory>
#include <mutex>

namespace nrt_predict::io {

namespace {

struct DatasetCloser {
    void operator()(GDALDataset* ds) const {
        if (ds) GDALClose(static_cast<GDALDatasetH>(ds));
    }
};

using DatasetPtr = std::unique_ptr<GDALDataset, DatasetCloser>;

std::string last_error(const std::string& fallback) {
    const char* msg = CPLGetLastErrorMsg();
    if (msg && *msg) return msg;
    return fallback;
}

DatasetPtr open_dataset(const std::string& path, unsigned int flags) {
    CPLErrorReset();
    auto* ds = static_cast<GDALDataset*>(
        GDALOpenEx(path.c_str(), flags | GDAL_OF_READONLY, nullptr, nullptr, nullptr));
    return DatasetPtr(ds);
}

DatasetPtr open_raster(const std::string& path) {
    auto ds = open_dataset(path, GDAL_OF_RASTER);
    if (!ds) {
        throw RasterError("cannot open '" + path + "': " + last_error("unknown error"));
    }
    return ds;
}

RasterInfo info_of(GDALDataset* ds) {
    RasterInfo info;
    double gt[6];
    if (ds->GetGeoTransform(gt) == CE_None) {
        for (int i = 0; i < 6; ++i) info.grid.transform[i] = gt[i];
    }
    const char* prj = ds->GetProjectionRef();
    info.grid.projection = prj ? prj : "";
    info.grid.width = ds->GetRasterXSize();
    info.grid.height = ds->GetRasterYSize();
    info.band_count = ds->GetRasterCount();
    if (info.band_count > 0) {
        int has_nodata = 0;
        const double nd = ds->GetRasterBand(1)->GetNoDataValue(&has_nodata);
        if (has_nodata) info.nodata = nd;
    }
    return info;
}

GDALDriver* find_driver(const std::string& name) {
    auto* drv = GetGDALDriverManager()->GetDriverByName(name.c_str());
    if (!drv) {
        throw RasterError("driver '" + name + "' is not available");
    }
    return drv;
}

bool can_create(GDALDriver* drv) {
    return CSLFetchBoolean(drv->GetMetadata(), GDAL_DCAP_CREATE, FALSE) != 0;
}

void write_bands(GDALDataset* ds, const Raster& raster, std::optional<double> nodata) {
    for (int i = 0; i < raster.band_count(); ++i) {
        GDALRasterBand* band = ds->GetRasterBand(i + 1);
        const Matrix2Df& data = raster.bands[static_cast<size_t>(i)];
        const CPLErr err = band->RasterIO(GF_Write, 0, 0, raster.width(), raster.height(),
                                          const_cast<float*>(data.data()), raster.width(),
                                          raster.height(), GDT_Float32, 0, 0);
        if (err != CE_None) {
            throw RasterError("write of band " + std::to_string(i + 1) + " failed: " +
                              last_error("unknown error"));
        }
        if (nodata) band->SetNoDataValue(*nodata);
    }
}

std::once_flag g_register_once;

} // namespace

GdalRasterBackend::GdalRasterBackend(const config::RasterSettings& settings) {
    std::call_once(g_register_once, []() { GDALAllRegister(); });
    for (const auto& [key, value] : settings.options) {
        CPLSetConfigOption(key.c_str(), value.c_str());
    }
}

RasterInfo GdalRasterBackend::open_info(const std::string& path) {
    auto ds = open_raster(path);
    return info_of(ds.get());
}

Raster GdalRasterBackend::read_raster(const std::string& path, int buf_width, int buf_height) {
    auto ds = open_raster(path);
    const int xs = ds->GetRasterXSize();
    const int ys = ds->GetRasterYSize();
    const int bw = buf_width > 0 ? buf_width : xs;
    const int bh = buf_height > 0 ? buf_height : ys;

    Raster raster;
    raster.bands.reserve(static_cast<size_t>(ds->GetRasterCount()));
    for (int i = 1; i <= ds->GetRasterCount(); ++i) {
        Matrix2Df band(bh, bw);
        const CPLErr err = ds->GetRasterBand(i)->RasterIO(GF_Read, 0, 0, xs, ys, band.data(), bw,
                                                          bh, GDT_Float32, 0, 0);
        if (err != CE_None) {
            throw RasterError("read of band " + std::to_string(i) + " of '" + path +
                              "' failed: " + last_error("unknown error"));
        }
        raster.bands.push_back(std::move(band));
    }
    return raster;
}

MaskMatrix GdalRasterBackend::read_mask(const std::string& path) {
    auto ds = open_raster(path);
    if (ds->GetRasterCount() < 1) {
        throw RasterError("'" + path + "' has no bands");
    }
    const int xs = ds->GetRasterXSize();
    const int ys = ds->GetRasterYSize();
    MaskMatrix mask(ys, xs);
    const CPLErr err =
        ds->GetRasterBand(1)->RasterIO(GF_Read, 0, 0, xs, ys, mask.data(), xs, ys, GDT_Byte, 0, 0);
    if (err != CE_None) {
        throw RasterError("read of mask '" + path + "' failed: " + last_error("unknown error"));
    }
    return mask;
}

std::optional<std::string> GdalRasterBackend::read_vector_footprint_wkt(const std::string& path) {
    auto ds = open_dataset(path, GDAL_OF_VECTOR);
    if (!ds || ds->GetLayerCount() < 1) {
        return std::nullopt;
    }
    OGRLayer* layer = ds->GetLayer(0);
    layer->ResetReading();
    std::unique_ptr<OGRFeature, decltype(&OGRFeature::DestroyFeature)> feature(
        layer->GetNextFeature(), &OGRFeature::DestroyFeature);
    if (!feature || !feature->GetGeometryRef()) {
        return std::nullopt;
    }

    char* wkt = nullptr;
    if (feature->GetGeometryRef()->exportToWkt(&wkt) != OGRERR_NONE || !wkt) {
        CPLFree(wkt);
        return std::nullopt;
    }
    std::string out(wkt);
    CPLFree(wkt);
    return out;
}

std::vector<uint8_t> GdalRasterBackend::http_get(const std::string& url) {
    CPLErrorReset();
    CPLHTTPResult* result = CPLHTTPFetch(url.c_str(), nullptr);
    if (!result) {
        throw IOError("HTTP GET '" + url + "' failed: " + last_error("no response"));
    }
    std::unique_ptr<CPLHTTPResult, decltype(&CPLHTTPDestroyResult)> guard(result,
                                                                          &CPLHTTPDestroyResult);
    if (result->nStatus != 0 || result->pszErrBuf) {
        throw IOError("HTTP GET '" + url + "' failed: " +
                      std::string(result->pszErrBuf ? result->pszErrBuf : "transfer error"));
    }
    return std::vector<uint8_t>(result->pabyData, result->pabyData + result->nDataLen);
}

void GdalRasterBackend::write_mem_file(const std::string& path, const std::vector<uint8_t>& bytes) {
    auto* buf = static_cast<GByte*>(VSIMalloc(bytes.empty() ? 1 : bytes.size()));
    if (!buf) {
        throw IOError("out of memory registering '" + path + "'");
    }
    if (!bytes.empty()) std::memcpy(buf, bytes.data(), bytes.size());
    VSILFILE* fp = VSIFileFromMemBuffer(path.c_str(), buf, bytes.size(), TRUE);
    if (!fp) {
        VSIFree(buf);
        throw IOError("cannot register in-memory file '" + path + "'");
    }
    VSIFCloseL(fp);
}

RasterInfo GdalRasterBackend::warp_to_cutline(const std::string& src, const std::string& dst,
                                              const std::string& cutline,
                                              const std::string& dst_srs) {
    auto src_ds = open_raster(src);

    CPLStringList argv;
    argv.AddString("-of");
    argv.AddString("GTiff");
    argv.AddString("-cutline");
    argv.AddString(cutline.c_str());
    argv.AddString("-crop_to_cutline");
    argv.AddString("-t_srs");
    argv.AddString(dst_srs.c_str());

    GDALWarpAppOptions* opts = GDALWarpAppOptionsNew(argv.List(), nullptr);
    if (!opts) {
        throw RasterError("invalid warp options: " + last_error("unknown error"));
    }

    GDALDatasetH src_h = static_cast<GDALDatasetH>(src_ds.get());
    int usage_error = FALSE;
    CPLErrorReset();
    GDALDatasetH out = GDALWarp(dst.c_str(), nullptr, 1, &src_h, opts, &usage_error);
    GDALWarpAppOptionsFree(opts);
    if (!out) {
        throw RasterError("warping '" + src + "' to cutline failed: " +
                          last_error("unknown error"));
    }
    DatasetPtr out_ds(static_cast<GDALDataset*>(out));
    return info_of(out_ds.get());
}

void GdalRasterBackend::write_cutline(const std::string& path, const geometry::Polygon& polygon,
                                      const std::string& projection) {
    GDALDriver* drv = find_driver("GeoJSON");
    VSIStatBufL st;
    if (VSIStatL(path.c_str(), &st) == 0) {
        VSIUnlink(path.c_str());
    }

    DatasetPtr ds(drv->Create(path.c_str(), 0, 0, 0, GDT_Unknown, nullptr));
    if (!ds) {
        throw RasterError("cannot create cutline '" + path + "': " + last_error("unknown error"));
    }

    OGRSpatialReference srs;
    if (srs.importFromWkt(projection.c_str()) != OGRERR_NONE) {
        throw RasterError("cutline projection is not valid WKT");
    }

    OGRLayer* layer = ds->CreateLayer("obs", &srs, wkbPolygon, nullptr);
    if (!layer) {
        throw RasterError("cannot create layer 'obs' in '" + path + "'");
    }

    OGRLinearRing ring;
    for (const auto& p : polygon.ring) {
        ring.addPoint(p.x, p.y);
    }
    OGRPolygon poly;
    poly.addRing(&ring);

    OGRFeature feature(layer->GetLayerDefn());
    feature.SetGeometry(&poly);
    if (layer->CreateFeature(&feature) != OGRERR_NONE) {
        throw RasterError("cannot write cutline feature to '" + path + "'");
    }
}

void GdalRasterBackend::write_raster(const std::string& path, const std::string& driver,
                                     const Raster& raster, const GridSpec& grid,
                                     std::optional<double> nodata) {
    if (raster.empty()) {
        throw RasterError("nothing to write to '" + path + "'");
    }
    GDALDriver* drv = find_driver(driver);

    double gt[6];
    for (int i = 0; i < 6; ++i) gt[i] = grid.transform[i];

    // Drivers without Create() get a MEM dataset copied over
    GDALDriver* target = can_create(drv) ? drv : find_driver("MEM");
    const std::string target_path = can_create(drv) ? path : std::string();

    DatasetPtr ds(target->Create(target_path.c_str(), raster.width(), raster.height(),
                                 raster.band_count(), GDT_Float32, nullptr));
    if (!ds) {
        throw RasterError("cannot create '" + path + "' with driver " + driver + ": " +
                          last_error("unknown error"));
    }
    ds->SetGeoTransform(gt);
    if (!grid.projection.empty()) ds->SetProjection(grid.projection.c_str());
    write_bands(ds.get(), raster, nodata);

    if (target != drv) {
        DatasetPtr copy(drv->CreateCopy(path.c_str(), ds.get(), FALSE, nullptr, nullptr, nullptr));
        if (!copy) {
            throw RasterError("cannot write '" + path + "' with driver " + driver + ": " +
                              last_error("unknown error"));
        }
    }
}

bool GdalRasterBackend::has_driver(const std::string& name) {
    return GetGDALDriverManager()->GetDriverByName(name.c_str()) != nullptr;
}

std::vector<std::string> GdalRasterBackend::driver_names() {
    std::vector<std::string> names;
    auto* mgr = GetGDALDriverManager();
    for (int i = 0; i < mgr->GetDriverCount(); ++i) {
        names.emplace_back(mgr->GetDriver(i)->GetDescription());
    }
    return names;
}

void GdalRasterBackend::remove(const std::string& path) {
    VSIStatBufL st;
    if (VSIStatL(path.c_str(), &st) != 0) {
        return;
    }
    if (VSIUnlink(path.c_str()) != 0) {
        throw IOError("cannot remove '" + path + "'");
    }
}

bool GdalRasterBackend::can_open(const std::string& path, std::string* error) {
    auto ds = open_dataset(path, GDAL_OF_RASTER);
    if (!ds) {
        if (error) *error = last_error("cannot open '" + path + "'");
        return false;
    }
    return true;
}

} // namespace nrt_predict::io
