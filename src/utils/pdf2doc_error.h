#ifndef PDF2DOC_ERROR_H
#define PDF2DOC_ERROR_H

#include <QString>

// pdf2doc 统一错误码：
// - 目标：状态区与弹窗只给出通用提示，日志里保留可稳定匹配的错误类别。
// - 约定：
//   - PDF = PDF 读取相关
//   - DOC = docx 生成与写盘相关
//   - UI = 交互状态相关
enum class Pdf2DocErrorCode
{
    None = 0,
    PdfLoadFailed,
    PdfLocked,
    DocxWriteFailed,
    UiInvalidState,
};

inline QString pdf2docErrorCodeTag(Pdf2DocErrorCode code)
{
    switch (code)
    {
    case Pdf2DocErrorCode::PdfLoadFailed: return QStringLiteral("P2D-PDF-001");
    case Pdf2DocErrorCode::PdfLocked: return QStringLiteral("P2D-PDF-002");
    case Pdf2DocErrorCode::DocxWriteFailed: return QStringLiteral("P2D-DOC-001");
    case Pdf2DocErrorCode::UiInvalidState: return QStringLiteral("P2D-UI-001");
    case Pdf2DocErrorCode::None:
    default:
        break;
    }
    return QStringLiteral("P2D-UNKNOWN");
}

inline QString formatPdf2DocError(Pdf2DocErrorCode code, const QString &message)
{
    if (code == Pdf2DocErrorCode::None) return message;
    return QStringLiteral("[%1] %2").arg(pdf2docErrorCodeTag(code), message);
}

#endif // PDF2DOC_ERROR_H
