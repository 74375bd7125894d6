#include <lxp/Backend/Windows/WindowsDesktopApi.hpp>
#include <lxp/Backend/Windows/ToastTemplate.hpp>
#include <lxp/Backend/Windows/WindowsErrors.hpp>
#include <lxp/Desktop/Preconditions.hpp>
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <string>

#include <windows.h>
#include <shellapi.h>

#include <winrt/base.h>
#include <winrt/Windows.Data.Xml.Dom.h>
#include <winrt/Windows.UI.Notifications.h>

namespace lxp {

using winrt::Windows::Data::Xml::Dom::XmlDocument;
using winrt::Windows::UI::Notifications::ToastNotification;
using winrt::Windows::UI::Notifications::ToastNotificationManager;

static std::wstring nativePath(const QString& path)
{
    return QDir::toNativeSeparators(QFileInfo(path).absoluteFilePath()).toStdWString();
}

// WinRT needs an apartment on the calling thread. A thread the host already
// initialized as STA reports RPC_E_CHANGED_MODE, which is fine to use.
static void ensureApartment()
{
    thread_local bool initialized = false;
    if (initialized)
        return;

    try {
        winrt::init_apartment(winrt::apartment_type::multi_threaded);
    } catch (const winrt::hresult_error& e) {
        if (e.code() != RPC_E_CHANGED_MODE)
            throw;
    }
    initialized = true;
}

WindowsDesktopApi::WindowsDesktopApi(const BackendOptions& options, const QOperatingSystemVersion& version)
    : options_(options)
    , appId_(options.appId.isEmpty() ? QString::fromLatin1(POWERSHELL_APP_ID) : options.appId)
    , capabilities_(windowsCapabilities(version))
{
    qInfo() << "[WindowsDesktopApi]" << version.name() << version.majorVersion() << version.minorVersion()
            << "capabilities:" << capabilityNames(capabilities_).join(QLatin1Char(','));
}

QString WindowsDesktopApi::name() const
{
    return QStringLiteral("windows");
}

CapabilitySet WindowsDesktopApi::capabilities() const
{
    return capabilities_;
}

DesktopResult WindowsDesktopApi::changeBackground(const QString& imagePath) const
{
    DesktopResult check = checkReadableFile(imagePath);
    if (!check)
        return check;

    std::wstring path = nativePath(imagePath);
    if (!SystemParametersInfoW(SPI_SETDESKWALLPAPER, 0, path.data(), SPIF_UPDATEINIFILE | SPIF_SENDCHANGE)) {
        DesktopResult failure = mapWin32Error(GetLastError(), QStringLiteral("SystemParametersInfoW"));
        qWarning() << "[WindowsDesktopApi] wallpaper failed:" << failure.error().toString();
        return failure;
    }

    qInfo() << "[WindowsDesktopApi] wallpaper set to" << QString::fromStdWString(path);
    return DesktopResult::success();
}

DesktopResult WindowsDesktopApi::sendNotification(const Notification& notification) const
{
    DesktopResult check = checkNotificationSupported(notification, capabilities_);
    if (!check)
        return check;

    if (notification.icon().kind() == NotificationIcon::Kind::Raw)
        qDebug() << "[WindowsDesktopApi] raw icon ignored";

    const QString xml = ToastTemplate::build(notification, options_.notificationSound);

    try {
        ensureApartment();

        XmlDocument document;
        document.LoadXml(winrt::hstring(xml.toStdWString()));
        ToastNotification toast(document);
        ToastNotificationManager::CreateToastNotifier(winrt::hstring(appId_.toStdWString())).Show(toast);
    } catch (const winrt::hresult_error& e) {
        const qint64 code = static_cast<qint64>(static_cast<int32_t>(e.code()));
        const QString message = QString::fromWCharArray(e.message().c_str());
        qWarning() << "[WindowsDesktopApi] toast failed:" << message << code;
        if (e.code() == E_ACCESSDENIED)
            return DesktopResult::failure(DesktopErrorKind::PermissionDenied, message, code);
        return DesktopResult::failure(DesktopErrorKind::NotificationError, message, code);
    }

    qDebug() << "[WindowsDesktopApi] toast shown:" << notification.title();
    return DesktopResult::success();
}

DesktopResult WindowsDesktopApi::openFile(const QString& path) const
{
    DesktopResult check = checkReadableFile(path);
    if (!check)
        return check;

    const std::wstring file = nativePath(path);
    HINSTANCE result = ShellExecuteW(nullptr, L"open", file.c_str(), nullptr, nullptr, SW_SHOWNORMAL);
    return mapShellExecuteResult(reinterpret_cast<qintptr>(result), QString::fromStdWString(file));
}

} // namespace lxp
